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

#include <cstring>
#include <limits>
#include <sstream>
#include <string>

#include "termlog/error_code.hpp"
#include "termlog/error_stack.hpp"
#include "termlog/test_common.hpp"
#include "termlog/logbuf/log_buffer.hpp"
#include "termlog/logbuf/log_buffer_descriptor.hpp"
#include "termlog/logbuf/log_buffer_regions.hpp"
#include "termlog/logbuf/term_cleaner.hpp"
#include "termlog/logbuf/test_log_buffer_common.hpp"
#include "termlog/memory/aligned_memory.hpp"

/**
 * @file test_log_buffer.cpp
 * Testcases for LogBuffer in a single thread.
 */
namespace termlog {
namespace logbuf {
DEFINE_TEST_CASE_PACKAGE(LogBufferTest, termlog.logbuf);

void fill_active_term(LogBuffer* buffer) {
  TermOffset offset;
  PartitionIndex active = buffer->get_active_partition_index();
  uint32_t remaining = buffer->get_term_length()
    - buffer->get_term_meta_data(active).get_tail_counter();
  EXPECT_EQ(kErrorCodeOk, buffer->append(remaining, &offset));
}

TEST(LogBufferTest, Initialize) {
  TestLogBuffer buffer;
  EXPECT_TRUE(buffer->is_initialized());
  EXPECT_EQ(kTermMinLength, buffer->get_term_length());
  EXPECT_EQ(16, buffer->get_position_bits_to_shift());
  EXPECT_EQ(buffer->get_term_block(0) + kTermMinLength, buffer->get_term_block(1));
  EXPECT_EQ(buffer->get_term_block(1) + kTermMinLength, buffer->get_term_block(2));
  EXPECT_EQ(kErrorCodeAlreadyInitialized, buffer->initialize().get_error_code());
}

TEST(LogBufferTest, CreateStream) {
  TestLogBuffer buffer;
  buffer->create_stream(0);
  EXPECT_EQ(0, buffer->get_initial_term_id());
  EXPECT_EQ(0, buffer->get_active_term_id());
  EXPECT_EQ(0, buffer->get_active_partition_index());
  for (PartitionIndex i = 0; i < kPartitionCount; ++i) {
    EXPECT_EQ(kTermClean, buffer->get_term_meta_data(i).get_status());
    EXPECT_EQ(0, buffer->get_term_meta_data(i).get_tail_counter());
  }
  EXPECT_EQ(0, buffer->get_position());
}

TEST(LogBufferTest, CreateStreamNonZero) {
  TestLogBuffer buffer;
  buffer->create_stream(1000);
  EXPECT_EQ(1000, buffer->get_initial_term_id());
  EXPECT_EQ(1000, buffer->get_active_term_id());
  EXPECT_EQ(0, buffer->get_active_partition_index());
  EXPECT_EQ(0, buffer->get_position());
}

TEST(LogBufferTest, Append) {
  TestLogBuffer buffer;
  buffer->create_stream(0);
  TermOffset offset = -1;
  EXPECT_EQ(kErrorCodeOk, buffer->append(100, &offset));
  EXPECT_EQ(0, offset);
  EXPECT_EQ(kErrorCodeOk, buffer->append(28, &offset));
  EXPECT_EQ(100, offset);
  EXPECT_EQ(128, buffer->get_term_meta_data(0).get_tail_counter());
  EXPECT_EQ(128, buffer->get_position());
  // the writer owns [offset, offset + length). write something there.
  std::memset(buffer->get_term_block(0) + offset, 0x5A, 28);
  EXPECT_EQ(0x5A, buffer->get_term_block(0)[127]);
  EXPECT_EQ(0, buffer->get_term_block(0)[128]);
}

TEST(LogBufferTest, AppendZeroLength) {
  TestLogBuffer buffer;
  buffer->create_stream(0);
  TermOffset offset = -1;
  EXPECT_EQ(kErrorCodeOk, buffer->append(0, &offset));
  EXPECT_EQ(0, offset);
  EXPECT_EQ(0, buffer->get_position());
}

TEST(LogBufferTest, TermFull) {
  TestLogBuffer buffer;
  buffer->create_stream(0);
  TermOffset offset = -1;
  EXPECT_EQ(kErrorCodeOk, buffer->append(kTermMinLength - 8, &offset));
  EXPECT_EQ(0, offset);

  offset = -1;
  EXPECT_EQ(kErrorCodeLogBufTermFull, buffer->append(16, &offset));
  EXPECT_EQ(-1, offset);
  EXPECT_EQ(static_cast<TermOffset>(kTermMinLength - 8),
    buffer->get_term_meta_data(0).get_tail_counter());

  EXPECT_EQ(kErrorCodeOk, buffer->append(8, &offset));
  EXPECT_EQ(static_cast<TermOffset>(kTermMinLength - 8), offset);
  EXPECT_EQ(static_cast<TermOffset>(kTermMinLength),
    buffer->get_term_meta_data(0).get_tail_counter());
  EXPECT_EQ(kErrorCodeLogBufTermFull, buffer->append(8, &offset));
}

TEST(LogBufferTest, Rotate) {
  TestLogBuffer buffer;
  buffer->create_stream(0);
  fill_active_term(buffer.get());
  EXPECT_EQ(kErrorCodeOk, buffer->rotate());
  EXPECT_EQ(kTermNeedsCleaning, buffer->get_term_meta_data(0).get_status());
  EXPECT_EQ(kTermClean, buffer->get_term_meta_data(1).get_status());
  EXPECT_EQ(1, buffer->get_active_term_id());
  EXPECT_EQ(1, buffer->get_active_partition_index());
  EXPECT_EQ(65536, buffer->get_position());
  EXPECT_EQ(65536, buffer->get_position(0));

  TermOffset offset = -1;
  EXPECT_EQ(kErrorCodeOk, buffer->append(64, &offset));
  EXPECT_EQ(0, offset);
  EXPECT_EQ(65536 + 64, buffer->get_position());
}

TEST(LogBufferTest, RotateNotFull) {
  TestLogBuffer buffer;
  buffer->create_stream(0);
  TermOffset offset;
  EXPECT_EQ(kErrorCodeOk, buffer->append(256, &offset));
  EXPECT_EQ(kErrorCodeOk, buffer->rotate());
  EXPECT_EQ(1, buffer->get_active_partition_index());
  EXPECT_EQ(256, buffer->get_position(0));
  EXPECT_EQ(65536, buffer->get_position());
}

TEST(LogBufferTest, ThirdTerm) {
  TestLogBuffer buffer;
  buffer->create_stream(0);
  EXPECT_EQ(kErrorCodeOk, buffer->rotate());
  EXPECT_EQ(kErrorCodeOk, buffer->rotate());
  EXPECT_EQ(2, buffer->get_active_term_id());
  EXPECT_EQ(2, buffer->get_active_partition_index());
  TermOffset offset;
  EXPECT_EQ(kErrorCodeOk, buffer->append(100, &offset));
  EXPECT_EQ(131172, buffer->get_position());

  LogLocation expected;
  expected.term_id_ = 2;
  expected.partition_index_ = 2;
  expected.term_offset_ = 100;
  EXPECT_EQ(expected, buffer->position_to_location(131172));
}

TEST(LogBufferTest, RotationBlocked) {
  TestLogBuffer buffer;
  buffer->create_stream(0);
  TermOffset offset;
  EXPECT_EQ(kErrorCodeOk, buffer->append(512, &offset));
  buffer->get_term_meta_data(1).set_status(kTermNeedsCleaning);

  EXPECT_EQ(kErrorCodeLogBufRotationBlocked, buffer->rotate());
  EXPECT_EQ(0, buffer->get_active_term_id());
  EXPECT_EQ(0, buffer->get_active_partition_index());
  EXPECT_EQ(kTermClean, buffer->get_term_meta_data(0).get_status());
  EXPECT_EQ(kTermNeedsCleaning, buffer->get_term_meta_data(1).get_status());
  EXPECT_EQ(kTermClean, buffer->get_term_meta_data(2).get_status());
  EXPECT_EQ(512, buffer->get_term_meta_data(0).get_tail_counter());
  EXPECT_EQ(512, buffer->get_position());

  // still appendable
  EXPECT_EQ(kErrorCodeOk, buffer->append(8, &offset));
  EXPECT_EQ(512, offset);
}

TEST(LogBufferTest, FullCycle) {
  TestLogBuffer buffer;
  buffer->create_stream(0);
  TermCleaner cleaner(buffer.get());
  EXPECT_EQ(kErrorCodeOk, buffer->rotate());
  EXPECT_EQ(kErrorCodeOk, buffer->rotate());
  // partition 0 is not cleaned yet
  EXPECT_EQ(kErrorCodeLogBufRotationBlocked, buffer->rotate());
  EXPECT_EQ(2, buffer->get_active_term_id());

  EXPECT_EQ(kErrorCodeOk, cleaner.clean_partition(0));
  EXPECT_EQ(kErrorCodeOk, buffer->rotate());
  EXPECT_EQ(3, buffer->get_active_term_id());
  EXPECT_EQ(0, buffer->get_active_partition_index());
  EXPECT_EQ(3LL << 16, buffer->get_position());
  EXPECT_EQ(kTermNeedsCleaning, buffer->get_term_meta_data(1).get_status());
  EXPECT_EQ(kTermNeedsCleaning, buffer->get_term_meta_data(2).get_status());
}

TEST(LogBufferTest, TermIdWrapAround) {
  const TermId kMaxTermId = std::numeric_limits<TermId>::max();
  const TermId kMinTermId = std::numeric_limits<TermId>::min();
  TestLogBuffer buffer;
  buffer->create_stream(kMaxTermId);
  EXPECT_EQ(kErrorCodeOk, buffer->rotate());
  EXPECT_EQ(kMinTermId, buffer->get_active_term_id());
  EXPECT_EQ(1, buffer->get_active_partition_index());
  EXPECT_EQ(65536, buffer->get_position());

  TermOffset offset;
  EXPECT_EQ(kErrorCodeOk, buffer->append(8, &offset));
  LogLocation location = buffer->position_to_location(buffer->get_position());
  EXPECT_EQ(kMinTermId, location.term_id_);
  EXPECT_EQ(1, location.partition_index_);
  EXPECT_EQ(8, location.term_offset_);
}

TEST(LogBufferTest, TermIdExhausted) {
  const TermId kMaxTermId = std::numeric_limits<TermId>::max();
  TestLogBuffer buffer;
  buffer->create_stream(0);
  // 2^31 - 1 terms after the initial one
  buffer->get_log_meta_data().set_active_term_id(kMaxTermId);
  const PartitionIndex active = buffer->get_active_partition_index();
  EXPECT_EQ(1, active);
  TermOffset offset;
  EXPECT_EQ(kErrorCodeOk, buffer->append(64, &offset));

  EXPECT_EQ(kErrorCodeLogBufTermIdExhausted, buffer->rotate());
  EXPECT_EQ(kMaxTermId, buffer->get_active_term_id());
  EXPECT_EQ(active, buffer->get_active_partition_index());
  for (PartitionIndex i = 0; i < kPartitionCount; ++i) {
    EXPECT_EQ(kTermClean, buffer->get_term_meta_data(i).get_status()) << i;
  }
  EXPECT_EQ(64, buffer->get_term_meta_data(active).get_tail_counter());
  EXPECT_EQ((static_cast<LogPosition>(kMaxTermId) << 16) + 64, buffer->get_position());

  // the active partition is still usable
  EXPECT_EQ(kErrorCodeOk, buffer->append(64, &offset));
  EXPECT_EQ(64, offset);
}

TEST(LogBufferTest, LastRotation) {
  const TermId kMaxTermId = std::numeric_limits<TermId>::max();
  TestLogBuffer buffer;
  buffer->create_stream(0);
  buffer->get_log_meta_data().set_active_term_id(kMaxTermId - 1);
  EXPECT_EQ(0, buffer->get_active_partition_index());
  EXPECT_EQ(kErrorCodeOk, buffer->rotate());
  EXPECT_EQ(kMaxTermId, buffer->get_active_term_id());
  EXPECT_EQ(1, buffer->get_active_partition_index());
  EXPECT_EQ(kTermNeedsCleaning, buffer->get_term_meta_data(0).get_status());
  EXPECT_EQ(kTermClean, buffer->get_term_meta_data(1).get_status());
  EXPECT_EQ(kErrorCodeLogBufTermIdExhausted, buffer->rotate());
  EXPECT_EQ(kTermClean, buffer->get_term_meta_data(1).get_status());
}

TEST(LogBufferTest, RotateNeverActivatesDirty) {
  TestLogBuffer buffer;
  buffer->create_stream(-7);
  TermCleaner cleaner(buffer.get());
  for (int i = 0; i < 10; ++i) {
    ASSERT_EQ(kErrorCodeOk, buffer->rotate());
    PartitionIndex active = buffer->get_active_partition_index();
    EXPECT_EQ(kTermClean, buffer->get_term_meta_data(active).get_status()) << i;
    uint16_t cleaned;
    ASSERT_EQ(kErrorCodeOk, cleaner.clean_all_dirty(&cleaned));
  }
}

TEST(LogBufferTest, AppendToDirtyActive) {
  TestLogBuffer buffer;
  buffer->create_stream(0);
  TermOffset offset = -1;
  EXPECT_EQ(kErrorCodeOk, buffer->append(128, &offset));
  buffer->get_term_meta_data(0).set_status(kTermNeedsCleaning);
  offset = -1;
  EXPECT_EQ(kErrorCodeLogBufActiveTermDirty, buffer->append(64, &offset));
  EXPECT_EQ(-1, offset);
  EXPECT_EQ(128, buffer->get_term_meta_data(0).get_tail_counter());
}

TEST(LogBufferTest, PositionOfOlderPartitions) {
  TestLogBuffer buffer;
  buffer->create_stream(0);
  TermOffset offset;
  EXPECT_EQ(kErrorCodeOk, buffer->append(1000, &offset));
  EXPECT_EQ(kErrorCodeOk, buffer->rotate());
  EXPECT_EQ(kErrorCodeOk, buffer->append(2000, &offset));
  EXPECT_EQ(kErrorCodeOk, buffer->rotate());
  EXPECT_EQ(kErrorCodeOk, buffer->append(3000, &offset));
  EXPECT_EQ(1000, buffer->get_position(0));
  EXPECT_EQ(65536 + 2000, buffer->get_position(1));
  EXPECT_EQ(131072 + 3000, buffer->get_position(2));
  EXPECT_EQ(buffer->get_position(2), buffer->get_position());
}

memory::AlignedMemory allocate(uint64_t size) {
  return memory::AlignedMemory(size, 1U << 12, memory::AlignedMemory::kPosixMemalign, 0);
}

TEST(LogBufferTest, TermLengthMismatch) {
  memory::AlignedMemory terms[kPartitionCount] = {
    allocate(kTermMinLength),
    allocate(kTermMinLength),
    allocate(kTermMinLength * 2)};
  memory::AlignedMemory meta = allocate(1U << 12);
  LogBufferRegions regions;
  for (PartitionIndex i = 0; i < kPartitionCount; ++i) {
    regions.term_regions_[i] = terms[i].as_region();
    regions.term_meta_data_regions_[i] = meta.as_region().sub_region(
      i * kTermMetaDataLength,
      kTermMetaDataLength);
  }
  regions.log_meta_data_region_ = meta.as_region().sub_region(
    kPartitionCount * kTermMetaDataLength,
    kLogMetaDataLength);

  LogBuffer buffer(regions);
  ErrorStack error = buffer.initialize();
  EXPECT_EQ(kErrorCodeLogBufTermLengthMismatch, error.get_error_code());
  EXPECT_FALSE(buffer.is_initialized());
}

TEST(LogBufferTest, SeparateRegions) {
  memory::AlignedMemory terms[kPartitionCount] = {
    allocate(kTermMinLength),
    allocate(kTermMinLength),
    allocate(kTermMinLength)};
  memory::AlignedMemory meta = allocate(1U << 12);
  LogBufferRegions regions;
  for (PartitionIndex i = 0; i < kPartitionCount; ++i) {
    regions.term_regions_[i] = terms[i].as_region();
    regions.term_meta_data_regions_[i] = meta.as_region().sub_region(
      i * kTermMetaDataLength,
      kTermMetaDataLength);
  }
  regions.log_meta_data_region_ = meta.as_region().sub_region(
    kPartitionCount * kTermMetaDataLength,
    kLogMetaDataLength);

  LogBuffer buffer(regions);
  EXPECT_FALSE(buffer.initialize().is_error());
  buffer.create_stream(42);
  EXPECT_EQ(kErrorCodeOk, buffer.rotate());
  EXPECT_EQ(43, buffer.get_active_term_id());
  EXPECT_EQ(reinterpret_cast<char*>(terms[1].get_block()), buffer.get_term_block(1));
  EXPECT_FALSE(buffer.uninitialize().is_error());
}

TEST(LogBufferTest, InvalidTermRegion) {
  memory::AlignedMemory block = allocate(compute_log_length(kTermMinLength) + 8);
  LogBufferRegions regions = LogBufferRegions::slice(block.as_region(), kTermMinLength);
  regions.term_regions_[1].length_ = kTermMinLength + 8;
  LogBuffer buffer(regions);
  EXPECT_EQ(kErrorCodeLogBufInvalidLayout, buffer.initialize().get_error_code());
  EXPECT_FALSE(buffer.is_initialized());
}

TEST(LogBufferTest, InvalidMetaDataRegion) {
  memory::AlignedMemory block = allocate(compute_log_length(kTermMinLength));
  LogBufferRegions regions = LogBufferRegions::slice(block.as_region(), kTermMinLength);
  regions.term_meta_data_regions_[2].length_ = kTermMetaDataLength - 1;
  LogBuffer buffer(regions);
  EXPECT_EQ(kErrorCodeLogBufInvalidLayout, buffer.initialize().get_error_code());

  LogBufferRegions regions2 = LogBufferRegions::slice(block.as_region(), kTermMinLength);
  regions2.log_meta_data_region_ = memory::MemoryRegion();
  LogBuffer buffer2(regions2);
  EXPECT_EQ(kErrorCodeLogBufInvalidLayout, buffer2.initialize().get_error_code());
  EXPECT_FALSE(buffer2.is_initialized());
}

TEST(LogBufferTest, Print) {
  TestLogBuffer buffer;
  buffer->create_stream(7);
  std::stringstream str;
  str << *buffer.get();
  EXPECT_NE(std::string::npos, str.str().find("<LogBuffer>"));
  EXPECT_NE(std::string::npos, str.str().find("<initial_term_id_>7</initial_term_id_>"));

  std::stringstream str2;
  str2 << buffer->position_to_location(65536 + 8);
  EXPECT_NE(std::string::npos, str2.str().find("<term_id_>8</term_id_>"));
}

}  // namespace logbuf
}  // namespace termlog

TEST_MAIN_CAPTURE_SIGNALS(LogBufferTest, termlog.logbuf);
