/*
 * Copyright (c) 2014-2015, Hewlett-Packard Development Company, LP.
 * This program is free software; you can redistribute it and/or modify it
 * under the terms of the GNU General Public License as published by the Free
 * Software Foundation; either version 2 of the License, or (at your option)
 * any later version.
 *
 * This program is distributed in the hope that it will be useful, but WITHOUT
 * ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
 * FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for
 * more details. You should have received a copy of the GNU General Public
 * License along with this program; if not, write to the Free Software
 * Foundation, Inc., 59 Temple Place, Suite 330, Boston, MA 02111-1307 USA
 *
 * HP designates this particular file as subject to the "Classpath" exception
 * as provided by HP in the LICENSE.txt file that accompanied this code.
 */
#include <stdint.h>
#include <gtest/gtest.h>

#include <limits>

#include "termlog/test_common.hpp"
#include "termlog/assorted/uniform_random.hpp"
#include "termlog/logbuf/log_buffer_descriptor.hpp"
#include "termlog/logbuf/logbuf_id.hpp"
#include "termlog/logbuf/position_codec.hpp"

/**
 * @file test_position_codec.cpp
 * Testcases for the conversion between (term id, term offset) and log positions.
 */
namespace termlog {
namespace logbuf {
DEFINE_TEST_CASE_PACKAGE(PositionCodecTest, termlog.logbuf);

const TermId kMaxTermId = std::numeric_limits<TermId>::max();
const TermId kMinTermId = std::numeric_limits<TermId>::min();

TEST(PositionCodecTest, TermCount) {
  EXPECT_EQ(0, compute_term_count(5, 5));
  EXPECT_EQ(2, compute_term_count(7, 5));
  EXPECT_EQ(-2, compute_term_count(5, 7));
  EXPECT_EQ(1, compute_term_count(kMinTermId, kMaxTermId));
  EXPECT_EQ(3, compute_term_count(kMinTermId + 1, kMaxTermId - 1));
}

TEST(PositionCodecTest, ThirdTerm) {
  const uint8_t bits = compute_position_bits_to_shift(kTermMinLength);
  LogPosition position = compute_position(2, 100, bits, 0);
  EXPECT_EQ(131172, position);
  EXPECT_EQ(2, compute_term_id_from_position(position, bits, 0));
  EXPECT_EQ(100, compute_term_offset_from_position(position, bits));
}

TEST(PositionCodecTest, NonZeroInitialTermId) {
  const uint8_t bits = compute_position_bits_to_shift(kTermMinLength);
  EXPECT_EQ(0, compute_position(1000, 0, bits, 1000));
  EXPECT_EQ((5LL << 16) + 8, compute_position(105, 8, bits, 100));
  EXPECT_EQ(105, compute_term_id_from_position((5LL << 16) + 8, bits, 100));
  EXPECT_EQ(-95, compute_term_id_from_position((5LL << 16) + 8, bits, -100));
}

TEST(PositionCodecTest, TermBoundary) {
  const uint8_t bits = compute_position_bits_to_shift(kTermMinLength);
  LogPosition last = compute_position(0, kTermMinLength - 1, bits, 0);
  EXPECT_EQ(0, compute_term_id_from_position(last, bits, 0));
  EXPECT_EQ(static_cast<TermOffset>(kTermMinLength - 1),
    compute_term_offset_from_position(last, bits));

  // a full term and the head of the next term share the same position
  EXPECT_EQ(compute_position(1, 0, bits, 0), compute_position(0, kTermMinLength, bits, 0));
  EXPECT_EQ(1, compute_term_id_from_position(last + 1, bits, 0));
  EXPECT_EQ(0, compute_term_offset_from_position(last + 1, bits));
}

TEST(PositionCodecTest, TermIdWrapAround) {
  const uint8_t bits = compute_position_bits_to_shift(kTermMinLength);
  LogPosition position = compute_position(kMinTermId, 8, bits, kMaxTermId);
  EXPECT_EQ(65536 + 8, position);
  EXPECT_EQ(kMinTermId, compute_term_id_from_position(position, bits, kMaxTermId));
  EXPECT_EQ(8, compute_term_offset_from_position(position, bits));

  position = compute_position(kMinTermId + 4, 16, bits, kMaxTermId - 2);
  EXPECT_EQ((7LL << 16) + 16, position);
  EXPECT_EQ(kMinTermId + 4, compute_term_id_from_position(position, bits, kMaxTermId - 2));
}

TEST(PositionCodecTest, LargestTerm) {
  const uint8_t bits = compute_position_bits_to_shift(kTermMaxLength);
  LogPosition position = compute_position(3, kTermMaxLength - 8, bits, 0);
  EXPECT_EQ((3LL << 30) + kTermMaxLength - 8, position);
  EXPECT_EQ(3, compute_term_id_from_position(position, bits, 0));
  EXPECT_EQ(static_cast<TermOffset>(kTermMaxLength - 8),
    compute_term_offset_from_position(position, bits));
}

TEST(PositionCodecTest, Random) {
  assorted::UniformRandom rnd(123456);
  for (int i = 0; i < 1000; ++i) {
    const uint8_t bits = static_cast<uint8_t>(16 + rnd.next_uint32() % 15);
    const TermId initial_term_id = rnd.next_int32();
    const uint32_t terms = rnd.next_uint32() % ((1U << 20) + 1);
    const TermId term_id = static_cast<TermId>(static_cast<uint32_t>(initial_term_id) + terms);
    const TermOffset offset = static_cast<TermOffset>(
      (rnd.next_uint32() & ((1U << bits) - 1)) & ~(kFrameAlignment - 1));

    LogPosition position = compute_position(term_id, offset, bits, initial_term_id);
    EXPECT_GE(position, 0);
    EXPECT_EQ(term_id, compute_term_id_from_position(position, bits, initial_term_id));
    EXPECT_EQ(offset, compute_term_offset_from_position(position, bits));
  }
}

}  // namespace logbuf
}  // namespace termlog

TEST_MAIN_CAPTURE_SIGNALS(PositionCodecTest, termlog.logbuf);
