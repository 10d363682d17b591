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

#include <string>

#include "termlog/error_stack.hpp"
#include "termlog/test_common.hpp"
#include "termlog/logbuf/log_buffer_descriptor.hpp"
#include "termlog/logbuf/log_buffer_regions.hpp"
#include "termlog/memory/aligned_memory.hpp"
#include "termlog/memory/memory_region.hpp"

/**
 * @file test_log_buffer_descriptor.cpp
 * Testcases for the layout constants and region validation.
 */
namespace termlog {
namespace logbuf {
DEFINE_TEST_CASE_PACKAGE(LogBufferDescriptorTest, termlog.logbuf);

TEST(LogBufferDescriptorTest, MetaDataLength) {
  EXPECT_EQ(128U, term_meta_data_length());
  EXPECT_EQ(64U, log_meta_data_length());
  EXPECT_EQ(0U, kTermHighWaterMarkOffset);
  EXPECT_EQ(4U, kTermStatusOffset);
  EXPECT_EQ(64U, kTermTailCounterOffset);
  EXPECT_EQ(0U, kLogInitialTermIdOffset);
  EXPECT_EQ(4U, kLogActiveTermIdOffset);
}

TEST(LogBufferDescriptorTest, LogLength) {
  EXPECT_EQ(197056U, compute_log_length(kTermMinLength));
  EXPECT_EQ(3ULL * (1U << 20) + 3U * 128U + 64U, compute_log_length(1U << 20));
  EXPECT_EQ(3ULL * kTermMaxLength + 3U * 128U + 64U, compute_log_length(kTermMaxLength));
}

TEST(LogBufferDescriptorTest, Offsets) {
  EXPECT_EQ(0U, compute_term_offset(0, kTermMinLength));
  EXPECT_EQ(65536U, compute_term_offset(1, kTermMinLength));
  EXPECT_EQ(131072U, compute_term_offset(2, kTermMinLength));
  EXPECT_EQ(196608U, compute_term_meta_data_offset(0, kTermMinLength));
  EXPECT_EQ(196736U, compute_term_meta_data_offset(1, kTermMinLength));
  EXPECT_EQ(196864U, compute_term_meta_data_offset(2, kTermMinLength));
  EXPECT_EQ(196992U, compute_log_meta_data_offset(kTermMinLength));
  EXPECT_EQ(
    compute_log_length(kTermMinLength),
    compute_log_meta_data_offset(kTermMinLength) + log_meta_data_length());
}

TEST(LogBufferDescriptorTest, ValidTermLength) {
  EXPECT_FALSE(validate_term_length(kTermMinLength).is_error());
  EXPECT_FALSE(validate_term_length(1U << 20).is_error());
  EXPECT_FALSE(validate_term_length(kTermMaxLength).is_error());
}

TEST(LogBufferDescriptorTest, TooShortTermLength) {
  ErrorStack error = validate_term_length(kTermMinLength / 2);
  EXPECT_EQ(kErrorCodeLogBufInvalidLayout, error.get_error_code());
  ASSERT_TRUE(error.get_custom_message());
  EXPECT_NE(std::string::npos, std::string(error.get_custom_message()).find("min length"));
  EXPECT_TRUE(validate_term_length(0).is_error());
  EXPECT_TRUE(validate_term_length(kTermMinLength - 8).is_error());
}

TEST(LogBufferDescriptorTest, TooLongTermLength) {
  ErrorStack error = validate_term_length(2ULL * kTermMaxLength);
  EXPECT_EQ(kErrorCodeLogBufInvalidLayout, error.get_error_code());
  ASSERT_TRUE(error.get_custom_message());
  EXPECT_NE(std::string::npos, std::string(error.get_custom_message()).find("max length"));
}

TEST(LogBufferDescriptorTest, NotPowerOfTwo) {
  ErrorStack error = validate_term_length(kTermMinLength + kFrameAlignment);
  EXPECT_EQ(kErrorCodeLogBufInvalidLayout, error.get_error_code());
  ASSERT_TRUE(error.get_custom_message());
  EXPECT_NE(std::string::npos, std::string(error.get_custom_message()).find("power of two"));
}

TEST(LogBufferDescriptorTest, NotAligned) {
  ErrorStack error = validate_term_length(kTermMinLength + 3);
  EXPECT_EQ(kErrorCodeLogBufInvalidLayout, error.get_error_code());
  ASSERT_TRUE(error.get_custom_message());
  EXPECT_NE(std::string::npos, std::string(error.get_custom_message()).find("multiple of"));
}

TEST(LogBufferDescriptorTest, TermRegion) {
  memory::AlignedMemory memory(1U << 17, 1U << 12, memory::AlignedMemory::kPosixMemalign, 0);
  memory::MemoryRegion whole = memory.as_region();
  EXPECT_FALSE(validate_term_region(whole.sub_region(0, kTermMinLength)).is_error());
  EXPECT_FALSE(validate_term_region(whole.sub_region(0, 1U << 17)).is_error());
  EXPECT_EQ(
    kErrorCodeLogBufInvalidLayout,
    validate_term_region(whole.sub_region(0, kTermMinLength + 8)).get_error_code());
  EXPECT_EQ(
    kErrorCodeLogBufInvalidLayout,
    validate_term_region(memory::MemoryRegion()).get_error_code());
}

TEST(LogBufferDescriptorTest, MetaDataRegion) {
  memory::AlignedMemory memory(1U << 12, 1U << 12, memory::AlignedMemory::kPosixMemalign, 0);
  memory::MemoryRegion whole = memory.as_region();
  EXPECT_FALSE(validate_meta_data_region(whole.sub_region(0, 128)).is_error());
  EXPECT_FALSE(validate_meta_data_region(whole.sub_region(0, 256)).is_error());
  EXPECT_EQ(
    kErrorCodeLogBufInvalidLayout,
    validate_meta_data_region(whole.sub_region(0, 127)).get_error_code());
  EXPECT_EQ(
    kErrorCodeLogBufInvalidLayout,
    validate_meta_data_region(memory::MemoryRegion()).get_error_code());

  EXPECT_FALSE(validate_log_meta_data_region(whole.sub_region(0, 64)).is_error());
  EXPECT_EQ(
    kErrorCodeLogBufInvalidLayout,
    validate_log_meta_data_region(whole.sub_region(0, 63)).get_error_code());
  EXPECT_EQ(
    kErrorCodeLogBufInvalidLayout,
    validate_log_meta_data_region(memory::MemoryRegion()).get_error_code());
}

TEST(LogBufferDescriptorTest, PositionBitsToShift) {
  EXPECT_EQ(16, compute_position_bits_to_shift(kTermMinLength));
  EXPECT_EQ(20, compute_position_bits_to_shift(1U << 20));
  EXPECT_EQ(30, compute_position_bits_to_shift(kTermMaxLength));
}

TEST(LogBufferDescriptorTest, Slice) {
  memory::AlignedMemory memory(
    compute_log_length(kTermMinLength),
    1U << 12,
    memory::AlignedMemory::kPosixMemalign,
    0);
  char* base = reinterpret_cast<char*>(memory.get_block());
  LogBufferRegions regions = LogBufferRegions::slice(memory.as_region(), kTermMinLength);
  for (PartitionIndex i = 0; i < kPartitionCount; ++i) {
    EXPECT_EQ(base + compute_term_offset(i, kTermMinLength), regions.term_regions_[i].get_block());
    EXPECT_EQ(kTermMinLength, regions.term_regions_[i].get_length());
    EXPECT_EQ(
      base + compute_term_meta_data_offset(i, kTermMinLength),
      regions.term_meta_data_regions_[i].get_block());
    EXPECT_EQ(kTermMetaDataLength, regions.term_meta_data_regions_[i].get_length());
  }
  EXPECT_EQ(base + 196992, regions.log_meta_data_region_.get_block());
  EXPECT_EQ(kLogMetaDataLength, regions.log_meta_data_region_.get_length());
}

}  // namespace logbuf
}  // namespace termlog

TEST_MAIN_CAPTURE_SIGNALS(LogBufferDescriptorTest, termlog.logbuf);
