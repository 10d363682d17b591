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
#ifndef TERMLOG_EXTERNALIZE_TINYXML_WRAPPER_HPP_
#define TERMLOG_EXTERNALIZE_TINYXML_WRAPPER_HPP_

#include <errno.h>
#include <stdint.h>
#include <tinyxml2.h>

#include <cstdlib>
#include <limits>
#include <sstream>
#include <string>

/**
 * @file termlog/externalize/tinyxml_wrapper.hpp
 * @ingroup EXTERNALIZE
 * @brief Reads and writes the text of a tinyxml2 element as the types option classes use.
 * @details
 * Included only from cpp files. Public headers forward-declare tinyxml2 types instead.
 * 64-bit integers are parsed by hand because tinyxml2's 64-bit Query/SetText functions
 * are not available in every major version.
 */
namespace termlog {
namespace externalize {

inline tinyxml2::XMLError read_text(const tinyxml2::XMLElement* element, bool* out) {
  return element->QueryBoolText(out);
}

inline tinyxml2::XMLError read_text(const tinyxml2::XMLElement* element, std::string* out) {
  const char* text = element->GetText();
  *out = text ? text : "";
  return tinyxml2::XML_SUCCESS;
}

/** Decimal, hex (0x) or octal (0). Trailing garbage and overflow are rejected. */
inline tinyxml2::XMLError read_text(const tinyxml2::XMLElement* element, int64_t* out) {
  const char* text = element->GetText();
  if (text == nullptr) {
    return tinyxml2::XML_NO_TEXT_NODE;
  }
  char* end = nullptr;
  errno = 0;
  long long value = std::strtoll(text, &end, 0);  // NOLINT(runtime/int)
  if (end == text || *end != '\0' || errno == ERANGE) {
    return tinyxml2::XML_CAN_NOT_CONVERT_TEXT;
  }
  *out = static_cast<int64_t>(value);
  return tinyxml2::XML_SUCCESS;
}

/**
 * Narrower integers go through int64_t and must fit the target type.
 * "-1" for an unsigned option is an error, not 4294967295.
 */
template <typename T>
tinyxml2::XMLError read_narrow_integer(const tinyxml2::XMLElement* element, T* out) {
  int64_t wide;
  tinyxml2::XMLError ret = read_text(element, &wide);
  if (ret != tinyxml2::XML_SUCCESS) {
    return ret;
  }
  if (wide < static_cast<int64_t>(std::numeric_limits<T>::min())
    || wide > static_cast<int64_t>(std::numeric_limits<T>::max())) {
    return tinyxml2::XML_CAN_NOT_CONVERT_TEXT;
  }
  *out = static_cast<T>(wide);
  return tinyxml2::XML_SUCCESS;
}

inline tinyxml2::XMLError read_text(const tinyxml2::XMLElement* element, int32_t* out) {
  return read_narrow_integer<int32_t>(element, out);
}
inline tinyxml2::XMLError read_text(const tinyxml2::XMLElement* element, uint32_t* out) {
  return read_narrow_integer<uint32_t>(element, out);
}
inline tinyxml2::XMLError read_text(const tinyxml2::XMLElement* element, int16_t* out) {
  return read_narrow_integer<int16_t>(element, out);
}

inline void write_text(tinyxml2::XMLElement* element, bool value) { element->SetText(value); }
inline void write_text(tinyxml2::XMLElement* element, int32_t value) { element->SetText(value); }
inline void write_text(tinyxml2::XMLElement* element, uint32_t value) { element->SetText(value); }
inline void write_text(tinyxml2::XMLElement* element, int16_t value) {
  element->SetText(static_cast<int>(value));
}
inline void write_text(tinyxml2::XMLElement* element, int64_t value) {
  std::stringstream str;
  str << value;
  element->SetText(str.str().c_str());
}
inline void write_text(tinyxml2::XMLElement* element, const std::string& value) {
  element->SetText(value.c_str());
}

}  // namespace externalize
}  // namespace termlog

#endif  // TERMLOG_EXTERNALIZE_TINYXML_WRAPPER_HPP_
