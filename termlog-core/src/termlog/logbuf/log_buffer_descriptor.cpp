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
#include "termlog/logbuf/log_buffer_descriptor.hpp"

#include <glog/logging.h>

#include <sstream>
#include <string>

#include "termlog/assert_nd.hpp"
#include "termlog/assorted/assorted_func.hpp"

namespace termlog {
namespace logbuf {

ErrorStack validate_term_length(uint64_t length) {
  std::stringstream message;
  if (length < kTermMinLength) {
    message << "Term buffer capacity less than min length of " << kTermMinLength
      << ", capacity=" << length;
  } else if (length > kTermMaxLength) {
    message << "Term buffer capacity more than max length of " << kTermMaxLength
      << ", capacity=" << length;
  } else if ((length & (kFrameAlignment - 1)) != 0) {
    message << "Term buffer capacity not a multiple of " << kFrameAlignment
      << ", capacity=" << length;
  } else if (!assorted::is_power_of_two(length)) {
    message << "Term buffer capacity not a power of two, capacity=" << length;
  } else {
    return kRetOk;
  }
  LOG(ERROR) << "Invalid term length. " << message.str();
  return ERROR_STACK_MSG(kErrorCodeLogBufInvalidLayout, message.str().c_str());
}

ErrorStack validate_term_region(const memory::MemoryRegion& region) {
  if (!region.is_valid()) {
    LOG(ERROR) << "Term buffer is not given. " << region;
    return ERROR_STACK_MSG(kErrorCodeLogBufInvalidLayout, "Term buffer is null");
  }
  CHECK_ERROR(validate_term_length(region.get_length()));
  return kRetOk;
}

namespace {
ErrorStack validate_min_length(
  const memory::MemoryRegion& region,
  uint32_t min_length,
  const char* name) {
  if (!region.is_valid() || region.get_length() < min_length) {
    std::stringstream message;
    message << name << " buffer capacity less than min length of " << min_length
      << ", capacity=" << region.get_length();
    if (!region.is_valid()) {
      message << " (null block)";
    }
    LOG(ERROR) << "Invalid metadata region. " << message.str();
    return ERROR_STACK_MSG(kErrorCodeLogBufInvalidLayout, message.str().c_str());
  }
  return kRetOk;
}
}  // namespace

ErrorStack validate_meta_data_region(const memory::MemoryRegion& region) {
  return validate_min_length(region, term_meta_data_length(), "Term meta data");
}

ErrorStack validate_log_meta_data_region(const memory::MemoryRegion& region) {
  return validate_min_length(region, log_meta_data_length(), "Log meta data");
}

uint8_t compute_position_bits_to_shift(uint32_t term_length) {
  ASSERT_ND(assorted::is_power_of_two(term_length));
  return assorted::floor_log2(term_length);
}

}  // namespace logbuf
}  // namespace termlog
