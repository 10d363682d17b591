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
#ifndef TERMLOG_EXTERNALIZE_EXTERNALIZABLE_HPP_
#define TERMLOG_EXTERNALIZE_EXTERNALIZABLE_HPP_

#include <stdint.h>

#include <iosfwd>
#include <string>

#include "termlog/cxx11.hpp"
#include "termlog/error_stack.hpp"

namespace tinyxml2 {
  class XMLElement;
}  // namespace tinyxml2

namespace termlog {
namespace externalize {
/**
 * @brief Option classes that are read from and written to XML.
 * @ingroup EXTERNALIZE
 * @details
 * A derived class puts EXTERNALIZABLE() in its public section and defines load() and save()
 * with the EXTERNALIZE_LOAD_* and EXTERNALIZE_SAVE_* macros, one line per member.
 * The root element of a document is named after the class. Nested option classes are child
 * elements named after their own class.
 *
 * Element values supported by add_element() and get_element(): bool, int16_t, int32_t,
 * uint32_t, int64_t and std::string. Enums are stored as int64_t.
 */
struct Externalizable {
  virtual ~Externalizable() {}

  /** Reads the members from the children of \b element. */
  virtual ErrorStack load(tinyxml2::XMLElement* element) = 0;
  /** Writes the members as children of \b element, which the caller created and named. */
  virtual ErrorStack save(tinyxml2::XMLElement* element) const = 0;
  /** Class name, used as the tag of the root element. */
  virtual const char* get_tag_name() const = 0;
  /** operator= of the derived class. \b other must be of the same class. */
  virtual void assign(const Externalizable* other) = 0;

  ErrorStack  load_from_string(const std::string& xml);
  ErrorStack  load_from_file(const std::string& path);
  /** Saves to a temporary file beside \b path and renames it over \b path. */
  ErrorStack  save_to_file(const std::string& path) const;
  /** XML text of save(), or a description of the error if save() failed. */
  void        save_to_stream(std::ostream* ptr) const;

  /** Puts an XML comment right before \b element. Empty comments are skipped. */
  static ErrorStack insert_comment(tinyxml2::XMLElement* element, const std::string& comment);

  /** Appends \<tag\>value\</tag\> to \b parent, preceded by \b comment with the type name. */
  template <typename T>
  static ErrorStack add_element(tinyxml2::XMLElement* parent, const std::string& tag,
                  const std::string& comment, T value);
  template <typename ENUM>
  static ErrorStack add_enum_element(tinyxml2::XMLElement* parent, const std::string& tag,
                const std::string& comment, ENUM value) {
    return add_element<int64_t>(parent, tag, comment, static_cast<int64_t>(value));
  }
  static ErrorStack add_child_element(tinyxml2::XMLElement* parent, const std::string& tag,
                  const std::string& comment, const Externalizable& child);

  /**
   * Reads the first \<tag\> child of \b parent.
   * A missing element is kErrorCodeConfMissingElement unless \b optional, in which case
   * \b out is set to \b default_value. Text that does not convert to T, or does not fit
   * it, is kErrorCodeConfInvalidElement.
   */
  template <typename T>
  static ErrorStack get_element(tinyxml2::XMLElement* parent, const std::string& tag,
                  T* out, bool optional = false, T default_value = T());
  /** Accepts a string literal as the default. */
  static ErrorStack get_element(tinyxml2::XMLElement* parent, const std::string& tag,
                  std::string* out, bool optional = false, const char* default_value = "");
  /** Stored as int64_t. A value outside ENUM is kErrorCodeConfValueOutofrange. */
  template <typename ENUM>
  static ErrorStack get_enum_element(tinyxml2::XMLElement* parent, const std::string& tag,
          ENUM* out, bool optional = false, ENUM default_value = static_cast<ENUM>(0)) {
    int64_t raw;
    CHECK_ERROR(get_element<int64_t>(parent, tag, &raw, optional,
                    static_cast<int64_t>(default_value)));
    if (static_cast<int64_t>(static_cast<ENUM>(raw)) != raw) {
      return ERROR_STACK_MSG(kErrorCodeConfValueOutofrange, tag.c_str());
    }
    *out = static_cast<ENUM>(raw);
    return kRetOk;
  }
  /** A missing child is left untouched when \b optional. */
  static ErrorStack get_child_element(tinyxml2::XMLElement* parent, const std::string& tag,
            Externalizable* child, bool optional = false);
};

}  // namespace externalize
}  // namespace termlog

#define EXTERNALIZE_QUOTE(str) #str
#define EXTERNALIZE_NAME(str) EXTERNALIZE_QUOTE(str)

/**
 * @def EXTERNALIZE_SAVE_ELEMENT(element, attribute, comment)
 * @ingroup EXTERNALIZE
 * @brief Saves member \b attribute as a child element with the member's name.
 */
#define EXTERNALIZE_SAVE_ELEMENT(element, attribute, comment) \
  CHECK_ERROR(add_element(element, EXTERNALIZE_NAME(attribute), comment, attribute))
#define EXTERNALIZE_SAVE_ENUM_ELEMENT(element, attribute, comment) \
  CHECK_ERROR(add_enum_element(element, EXTERNALIZE_NAME(attribute), comment, attribute))

/**
 * @def EXTERNALIZE_LOAD_ELEMENT(element, attribute)
 * @ingroup EXTERNALIZE
 * @brief Loads member \b attribute from the child element with the member's name.
 */
#define EXTERNALIZE_LOAD_ELEMENT(element, attribute) \
  CHECK_ERROR(get_element(element, EXTERNALIZE_NAME(attribute), & attribute))
#define EXTERNALIZE_LOAD_ELEMENT_OPTIONAL(element, attribute, default_value) \
  CHECK_ERROR(get_element(element, EXTERNALIZE_NAME(attribute), & attribute, true, default_value))
#define EXTERNALIZE_LOAD_ENUM_ELEMENT(element, attribute) \
  CHECK_ERROR(get_enum_element(element, EXTERNALIZE_NAME(attribute), & attribute))

/**
 * @def EXTERNALIZABLE(clazz)
 * @ingroup EXTERNALIZE
 * @brief Declares load() and save(), and defines the rest of Externalizable plus operator<<.
 */
#define EXTERNALIZABLE(clazz) \
  ErrorStack load(tinyxml2::XMLElement* element) CXX11_OVERRIDE;\
  ErrorStack save(tinyxml2::XMLElement* element) const CXX11_OVERRIDE;\
  const char* get_tag_name() const CXX11_OVERRIDE { return EXTERNALIZE_NAME(clazz); }\
  void assign(const termlog::externalize::Externalizable* other) CXX11_OVERRIDE {\
    *this = *dynamic_cast< const clazz * >(other);\
  }\
  friend std::ostream& operator<<(std::ostream& o, const clazz & v) {\
    v.save_to_stream(&o);\
    return o;\
  }

#endif  // TERMLOG_EXTERNALIZE_EXTERNALIZABLE_HPP_
