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
#ifndef TERMLOG_ASSORTED_ATOMIC_FENCES_HPP_
#define TERMLOG_ASSORTED_ATOMIC_FENCES_HPP_

#include <stdint.h>

/**
 * @file termlog/assorted/atomic_fences.hpp
 * @ingroup ASSORTED
 * @brief Ordered loads and stores on plain integers that live in a shared region.
 * @details
 * The log buffer counters are raw int32 fields at fixed byte offsets in a memory block that
 * may be shared between processes, so they cannot be std::atomic<T> members.
 * These wrap gcc/clang's __atomic builtins, which operate on any naturally aligned integer.
 */
namespace termlog {
namespace assorted {

/**
 * @brief Atomic load with an acquire barrier.
 * @ingroup ASSORTED
 * @details
 * Every write the storing thread made before its matching atomic_store_release() is visible
 * after this returns the stored value.
 */
template <typename T>
inline T atomic_load_acquire(const T* target) {
  return ::__atomic_load_n(target, __ATOMIC_ACQUIRE);
}

/**
 * @brief Atomic load without ordering. Never torn, but orders nothing else.
 * @ingroup ASSORTED
 * @details
 * For a value only the calling thread writes, such as the tail counter read by its writer.
 */
template <typename T>
inline T atomic_load_relaxed(const T* target) {
  return ::__atomic_load_n(target, __ATOMIC_RELAXED);
}

/**
 * @brief Atomic store with a release barrier ("ordered" store).
 * @ingroup ASSORTED
 * @details
 * Prior writes of this thread become visible no later than the value itself.
 */
template <typename T>
inline void atomic_store_release(T* target, T value) {
  ::__atomic_store_n(target, value, __ATOMIC_RELEASE);
}

}  // namespace assorted
}  // namespace termlog

#endif  // TERMLOG_ASSORTED_ATOMIC_FENCES_HPP_
