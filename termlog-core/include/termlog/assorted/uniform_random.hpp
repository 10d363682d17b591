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
#ifndef TERMLOG_ASSORTED_UNIFORM_RANDOM_HPP_
#define TERMLOG_ASSORTED_UNIFORM_RANDOM_HPP_

#include <stdint.h>

namespace termlog {
namespace assorted {

/**
 * @brief A very simple and deterministic random generator.
 * @ingroup ASSORTED
 * @details
 * A linear congruential generator. Not for anything security related.
 * Picks the initial term id when LogBufferOptions::randomize_initial_term_id_ is set.
 */
class UniformRandom {
 public:
  explicit UniformRandom(uint64_t seed) : seed_(seed) {}

  uint32_t next_uint32() {
    seed_ = seed_ * 0xD04C3175 + 0x53DA9022;
    return (seed_ >> 32) ^ (seed_ & 0xFFFFFFFF);
  }

  /** Full-range signed value, so negative term ids show up too. */
  int32_t next_int32() {
    return static_cast<int32_t>(next_uint32());
  }

 private:
  uint64_t seed_;
};

}  // namespace assorted
}  // namespace termlog

#endif  // TERMLOG_ASSORTED_UNIFORM_RANDOM_HPP_
