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
#ifndef TERMLOG_ASSORTED_CACHELINE_HPP_
#define TERMLOG_ASSORTED_CACHELINE_HPP_

#include <stdint.h>

/**
 * @file termlog/assorted/cacheline.hpp
 * @ingroup ASSORTED
 * @brief Cacheline size used to lay out metadata records.
 */

namespace termlog {
namespace assorted {

/**
 * @brief Byte count of one cache line.
 * @ingroup ASSORTED
 * @details
 * Every metadata record and every field written by a different party than its neighbors is
 * padded to this size so that producers and cleaners do not false-share.
 * The layout constants of termlog::logbuf are derived from it and are part of the shared
 * memory format, so it is fixed rather than detected.
 */
const uint16_t kCachelineSize = 64;

}  // namespace assorted
}  // namespace termlog

#endif  // TERMLOG_ASSORTED_CACHELINE_HPP_
