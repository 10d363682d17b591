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
#include "termlog/externalize/externalizable.hpp"

#include <sys/stat.h>
#include <tinyxml2.h>
#include <unistd.h>

#include <cstdio>
#include <ostream>
#include <sstream>
#include <string>

#include "termlog/assorted/assorted_func.hpp"
#include "termlog/externalize/tinyxml_wrapper.hpp"

namespace termlog {
namespace externalize {

namespace {
/**
 * Common tail of load_from_string() and load_from_file(). \b source names the input in
 * error messages.
 */
ErrorStack load_document(Externalizable* target, tinyxml2::XMLDocument* document,
             tinyxml2::XMLError parse_result, const std::string& source) {
  if (parse_result != tinyxml2::XML_SUCCESS) {
    std::stringstream str;
    str << source << ": tinyxml2 error " << document->ErrorID() << " ("
      << document->ErrorName() << ")";
    return ERROR_STACK_MSG(kErrorCodeConfParseFailed, str.str().c_str());
  }
  tinyxml2::XMLElement* root = document->RootElement();
  if (root == nullptr) {
    return ERROR_STACK_MSG(kErrorCodeConfEmptyXml, source.c_str());
  }
  CHECK_ERROR(target->load(root));
  return kRetOk;
}

/** New document with an empty root element named after \b source, filled by save(). */
ErrorStack save_document(const Externalizable& source, tinyxml2::XMLDocument* document) {
  tinyxml2::XMLElement* root = document->NewElement(source.get_tag_name());
  CHECK_OUTOFMEMORY(root);
  document->InsertFirstChild(root);
  CHECK_ERROR(source.save(root));
  return kRetOk;
}

ErrorStack write_failure(const std::string& what, const std::string& tmp_path) {
  std::string message = what + ", err=" + assorted::os_error();
  std::remove(tmp_path.c_str());
  return ERROR_STACK_MSG(kErrorCodeConfCouldNotWrite, message.c_str());
}
}  // anonymous namespace

ErrorStack Externalizable::load_from_string(const std::string& xml) {
  tinyxml2::XMLDocument document;
  tinyxml2::XMLError result = document.Parse(xml.data(), xml.size());
  return load_document(this, &document, result, "xml=" + xml);
}

ErrorStack Externalizable::load_from_file(const std::string& path) {
  struct stat st;
  if (::stat(path.c_str(), &st) != 0) {
    return ERROR_STACK_MSG(kErrorCodeConfFileNotFound, path.c_str());
  }
  tinyxml2::XMLDocument document;
  tinyxml2::XMLError result = document.LoadFile(path.c_str());
  return load_document(this, &document, result, "file=" + path);
}

ErrorStack Externalizable::save_to_file(const std::string& path) const {
  tinyxml2::XMLDocument document;
  CHECK_ERROR(save_document(*this, &document));

  std::stringstream tmp;
  tmp << path << ".tmp_" << ::getpid();
  const std::string tmp_path = tmp.str();
  if (document.SaveFile(tmp_path.c_str()) != tinyxml2::XML_SUCCESS) {
    return write_failure(std::string("could not write ") + tmp_path + ": "
      + document.ErrorName(), tmp_path);
  }
  if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
    return write_failure("could not rename " + tmp_path + " to " + path, tmp_path);
  }
  return kRetOk;
}

void Externalizable::save_to_stream(std::ostream* ptr) const {
  tinyxml2::XMLDocument document;
  ErrorStack error = save_document(*this, &document);
  if (error.is_error()) {
    *ptr << "Failed to externalize " << get_tag_name() << ": " << error;
    return;
  }
  tinyxml2::XMLPrinter printer;
  document.Print(&printer);
  *ptr << printer.CStr();
}

ErrorStack Externalizable::insert_comment(tinyxml2::XMLElement* element,
                      const std::string& comment) {
  if (comment.empty()) {
    return kRetOk;
  }
  tinyxml2::XMLDocument* document = element->GetDocument();
  tinyxml2::XMLComment* node = document->NewComment(comment.c_str());
  CHECK_OUTOFMEMORY(node);
  tinyxml2::XMLNode* parent = element->Parent();
  tinyxml2::XMLNode* previous = element->PreviousSibling();
  if (parent == nullptr) {
    document->InsertFirstChild(node);
  } else if (previous == nullptr) {
    parent->InsertFirstChild(node);
  } else {
    parent->InsertAfterChild(previous, node);
  }
  return kRetOk;
}

template <typename T>
ErrorStack Externalizable::add_element(tinyxml2::XMLElement* parent, const std::string& tag,
                     const std::string& comment, T value) {
  tinyxml2::XMLElement* element = parent->GetDocument()->NewElement(tag.c_str());
  CHECK_OUTOFMEMORY(element);
  write_text(element, value);
  parent->InsertEndChild(element);
  if (!comment.empty()) {
    std::string typed = tag + " (type=" + assorted::get_pretty_type_name<T>() + "): " + comment;
    CHECK_ERROR(insert_comment(element, typed));
  }
  return kRetOk;
}

ErrorStack Externalizable::add_child_element(tinyxml2::XMLElement* parent, const std::string& tag,
                     const std::string& comment, const Externalizable& child) {
  tinyxml2::XMLElement* element = parent->GetDocument()->NewElement(tag.c_str());
  CHECK_OUTOFMEMORY(element);
  parent->InsertEndChild(element);
  CHECK_ERROR(insert_comment(element, comment));
  CHECK_ERROR(child.save(element));
  return kRetOk;
}

template <typename T>
ErrorStack Externalizable::get_element(tinyxml2::XMLElement* parent, const std::string& tag,
                     T* out, bool optional, T default_value) {
  tinyxml2::XMLElement* element = parent->FirstChildElement(tag.c_str());
  if (element == nullptr) {
    if (!optional) {
      return ERROR_STACK_MSG(kErrorCodeConfMissingElement, tag.c_str());
    }
    *out = default_value;
    return kRetOk;
  }
  if (read_text(element, out) != tinyxml2::XML_SUCCESS) {
    return ERROR_STACK_MSG(kErrorCodeConfInvalidElement, tag.c_str());
  }
  return kRetOk;
}

ErrorStack Externalizable::get_element(tinyxml2::XMLElement* parent, const std::string& tag,
                     std::string* out, bool optional, const char* default_value) {
  return get_element<std::string>(parent, tag, out, optional, std::string(default_value));
}

ErrorStack Externalizable::get_child_element(tinyxml2::XMLElement* parent, const std::string& tag,
                       Externalizable* child, bool optional) {
  tinyxml2::XMLElement* element = parent->FirstChildElement(tag.c_str());
  if (element != nullptr) {
    return child->load(element);
  }
  if (optional) {
    return kRetOk;
  }
  return ERROR_STACK_MSG(kErrorCodeConfMissingElement, tag.c_str());
}

// @cond DOXYGEN_IGNORE
#define INSTANTIATE_ELEMENT_TYPE(T)\
  template ErrorStack Externalizable::add_element< T >(tinyxml2::XMLElement* parent,\
    const std::string& tag, const std::string& comment, T value);\
  template ErrorStack Externalizable::get_element< T >(tinyxml2::XMLElement* parent,\
    const std::string& tag, T* out, bool optional, T default_value)
INSTANTIATE_ELEMENT_TYPE(bool);
INSTANTIATE_ELEMENT_TYPE(int16_t);
INSTANTIATE_ELEMENT_TYPE(int32_t);
INSTANTIATE_ELEMENT_TYPE(uint32_t);
INSTANTIATE_ELEMENT_TYPE(int64_t);
INSTANTIATE_ELEMENT_TYPE(std::string);
#undef INSTANTIATE_ELEMENT_TYPE
// @endcond

}  // namespace externalize
}  // namespace termlog
