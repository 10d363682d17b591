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
#ifndef TERMLOG_LOGBUF_POSITION_CODEC_HPP_
#define TERMLOG_LOGBUF_POSITION_CODEC_HPP_

#include <stdint.h>

#include "termlog/logbuf/logbuf_id.hpp"

/**
 * @file termlog/logbuf/position_codec.hpp
 * @ingroup LOGBUF
 * @brief Conversion between stream positions and (term id, term offset).
 * @details
 * @code
 * position = ((active_term_id - initial_term_id) << position_bits_to_shift) + term_offset
 * @endcode
 * The subtraction wraps in 32 bits like the term id counter itself, and only then is
 * widened to 64 bits. So when the term id rolls over from INT32_MAX to INT32_MIN, the term
 * count keeps increasing and positions stay monotonic.
 * All arithmetic that may overflow is done on unsigned types.
 */
namespace termlog {
namespace logbuf {

/**
 * @brief Number of terms from initial_term_id to active_term_id, wrapping in 32 bits.
 * @ingroup LOGBUF
 * @details
 * compute_term_count(INT32_MIN, INT32_MAX) is 1.
 */
inline int64_t compute_term_count(TermId active_term_id, TermId initial_term_id) {
  uint32_t diff = static_cast<uint32_t>(active_term_id) - static_cast<uint32_t>(initial_term_id);
  return static_cast<int64_t>(static_cast<int32_t>(diff));
}

/**
 * @brief Position of term_offset in the term active_term_id.
 * @ingroup LOGBUF
 * @details
 * With initial_term_id 0 and 64KB terms (shift 16), offset 100 in term 2 is
 * (2 << 16) + 100 = 131172.
 */
inline LogPosition compute_position(
  TermId active_term_id,
  TermOffset term_offset,
  uint8_t position_bits_to_shift,
  TermId initial_term_id) {
  uint64_t term_count = static_cast<uint64_t>(
    compute_term_count(active_term_id, initial_term_id));
  return static_cast<LogPosition>(
    (term_count << position_bits_to_shift) + static_cast<uint64_t>(term_offset));
}

/**
 * @brief Term id that contains the position.
 * @ingroup LOGBUF
 */
inline TermId compute_term_id_from_position(
  LogPosition position,
  uint8_t position_bits_to_shift,
  TermId initial_term_id) {
  uint32_t term_count = static_cast<uint32_t>(
    static_cast<uint64_t>(position) >> position_bits_to_shift);
  return static_cast<TermId>(term_count + static_cast<uint32_t>(initial_term_id));
}

/**
 * @brief Offset of the position in its term.
 * @ingroup LOGBUF
 */
inline TermOffset compute_term_offset_from_position(
  LogPosition position,
  uint8_t position_bits_to_shift) {
  uint64_t mask = (1ULL << position_bits_to_shift) - 1ULL;
  return static_cast<TermOffset>(static_cast<uint64_t>(position) & mask);
}

}  // namespace logbuf
}  // namespace termlog
#endif  // TERMLOG_LOGBUF_POSITION_CODEC_HPP_
