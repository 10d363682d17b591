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
#ifndef TERMLOG_CXX11_HPP_
#define TERMLOG_CXX11_HPP_

/**
 * @file termlog/cxx11.hpp
 * @ingroup IDIOMS
 * @brief C++11 keywords used in public headers, as macros.
 * @details
 * A translation unit compiled without C++11 gets the keywords as nothing, and also loses the
 * move-only parts of public headers guarded by DISABLE_CXX11_IN_PUBLIC_HEADERS.
 */
#if __cplusplus < 201103L
#define DISABLE_CXX11_IN_PUBLIC_HEADERS
#endif  // __cplusplus < 201103L

#ifdef DISABLE_CXX11_IN_PUBLIC_HEADERS
#define CXX11_FUNC_DELETE
#define CXX11_FINAL
#define CXX11_NULLPTR NULL
#define CXX11_NOEXCEPT
#define CXX11_OVERRIDE
#else   // DISABLE_CXX11_IN_PUBLIC_HEADERS
#define CXX11_FUNC_DELETE = delete
#define CXX11_FINAL final
#define CXX11_NULLPTR nullptr
#define CXX11_NOEXCEPT noexcept
#define CXX11_OVERRIDE override
#endif  // DISABLE_CXX11_IN_PUBLIC_HEADERS

#endif  // TERMLOG_CXX11_HPP_
