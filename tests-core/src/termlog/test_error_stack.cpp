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
#include <gtest/gtest.h>

#include <cstring>
#include <sstream>
#include <string>

#include "termlog/error_code.hpp"
#include "termlog/error_stack.hpp"
#include "termlog/error_stack_batch.hpp"
#include "termlog/test_common.hpp"

/**
 * @file test_error_stack.cpp
 * Testcases for ErrorStack, ErrorStackBatch and the error macros.
 */
namespace termlog {
DEFINE_TEST_CASE_PACKAGE(ErrorStackTest, termlog);

ErrorStack func_fail() {
  return ERROR_STACK_MSG(kErrorCodeLogBufInvalidLayout, "first");
}
ErrorStack func_check() {
  CHECK_ERROR(func_fail());
  return kRetOk;
}
ErrorStack func_check_twice() {
  CHECK_ERROR(func_check());
  return kRetOk;
}
ErrorCode func_code_fail() {
  return kErrorCodeLogBufTermFull;
}
ErrorStack func_recurse(int levels) {
  if (levels == 0) {
    return ERROR_STACK(kErrorCodeInvalidParameter);
  }
  CHECK_ERROR(func_recurse(levels - 1));
  return kRetOk;
}
ErrorStack func_frameless() {
  ErrorStack error(kErrorCodeConfFileNotFound);
  CHECK_ERROR(error);
  return kRetOk;
}
ErrorCode func_check_code() {
  CHECK_ERROR_CODE(func_code_fail());
  return kErrorCodeOk;
}
ErrorStack func_outofmemory(void* ptr) {
  CHECK_OUTOFMEMORY(ptr);
  return kRetOk;
}

TEST(ErrorStackTest, NoError) {
  ErrorStack error;
  EXPECT_FALSE(error.is_error());
  EXPECT_EQ(kErrorCodeOk, error.get_error_code());
  EXPECT_EQ(0, error.get_stack_depth());
  EXPECT_FALSE(kRetOk.is_error());
}

TEST(ErrorStackTest, Names) {
  EXPECT_EQ(std::string("kErrorCodeOk"), get_error_name(kErrorCodeOk));
  EXPECT_EQ(std::string("kErrorCodeLogBufRotationBlocked"),
        get_error_name(kErrorCodeLogBufRotationBlocked));
  EXPECT_EQ(std::string("Not enough space left in the active term"),
        get_error_message(kErrorCodeLogBufTermFull));
}

TEST(ErrorStackTest, Stack) {
  ErrorStack error = func_check_twice();
  EXPECT_TRUE(error.is_error());
  EXPECT_EQ(kErrorCodeLogBufInvalidLayout, error.get_error_code());
  EXPECT_EQ(3, error.get_stack_depth());
  EXPECT_EQ(std::string("func_fail"), error.get_func(0));
  EXPECT_EQ(std::string("func_check"), error.get_func(1));
  EXPECT_EQ(std::string("func_check_twice"), error.get_func(2));
  EXPECT_EQ(std::string(__FILE__), error.get_filename(2));
  EXPECT_LT(error.get_linenum(0), error.get_linenum(2));
  EXPECT_EQ(std::string("first"), error.get_custom_message());
}

TEST(ErrorStackTest, StackDepthLimit) {
  ErrorStack error = func_recurse(20);
  EXPECT_EQ(kErrorCodeInvalidParameter, error.get_error_code());
  EXPECT_EQ(static_cast<uint16_t>(ErrorStack::kMaxStackDepth), error.get_stack_depth());
  EXPECT_EQ(std::string("func_recurse"), error.get_func(ErrorStack::kMaxStackDepth - 1));
  std::stringstream str;
  str << error;
  EXPECT_NE(std::string::npos, str.str().find("dropped"));
}

TEST(ErrorStackTest, Frameless) {
  ErrorStack error = func_frameless();
  EXPECT_EQ(kErrorCodeConfFileNotFound, error.get_error_code());
  EXPECT_EQ(0, error.get_stack_depth());
}

TEST(ErrorStackTest, CustomMessage) {
  ErrorStack error(kErrorCodeInvalidParameter);
  EXPECT_EQ(nullptr, error.get_custom_message());
  error.append_custom_message("abc");
  EXPECT_EQ(std::string("abc"), error.get_custom_message());
  error.append_custom_message("def");
  EXPECT_EQ(std::string("abcdef"), error.get_custom_message());
  EXPECT_TRUE(error.is_error());

  ErrorStack no_error;
  no_error.append_custom_message("ignored");
  EXPECT_EQ(nullptr, no_error.get_custom_message());
}

TEST(ErrorStackTest, Copy) {
  ErrorStack error = func_fail();
  ErrorStack copied(error);
  EXPECT_TRUE(copied.is_error());
  EXPECT_EQ(1, copied.get_stack_depth());
  EXPECT_EQ(std::string("first"), copied.get_custom_message());
  // the custom message moves to the copy
  EXPECT_EQ(nullptr, error.get_custom_message());
  EXPECT_TRUE(error.is_error());

  ErrorStack assigned;
  assigned = copied;
  EXPECT_TRUE(assigned.is_error());
  EXPECT_EQ(std::string("first"), assigned.get_custom_message());
  EXPECT_EQ(nullptr, copied.get_custom_message());
  ErrorStack& self = assigned;
  assigned = self;
  EXPECT_EQ(std::string("first"), assigned.get_custom_message());

  assigned = kRetOk;
  EXPECT_FALSE(assigned.is_error());
}

TEST(ErrorStackTest, CheckErrorCode) {
  EXPECT_EQ(kErrorCodeLogBufTermFull, func_check_code());
}

TEST(ErrorStackTest, OutOfMemory) {
  int dummy = 0;
  EXPECT_FALSE(func_outofmemory(&dummy).is_error());
  ErrorStack error = func_outofmemory(nullptr);
  EXPECT_EQ(kErrorCodeOutofmemory, error.get_error_code());
}

TEST(ErrorStackTest, Output) {
  ErrorStack error = func_check();
  std::stringstream str;
  str << error;
  std::string out = str.str();
  EXPECT_NE(std::string::npos, out.find("kErrorCodeLogBufInvalidLayout"));
  EXPECT_NE(std::string::npos, out.find("first"));
  EXPECT_NE(std::string::npos, out.find("func_check"));
}

TEST(ErrorStackTest, BatchEmpty) {
  ErrorStackBatch batch;
  batch.emprace_back(ErrorStack());
  batch.emprace_back(ErrorStack(kErrorCodeOk));
  EXPECT_FALSE(batch.is_error());
  EXPECT_EQ(0U, batch.size());
  EXPECT_FALSE(SUMMARIZE_ERROR_BATCH(batch).is_error());
}

TEST(ErrorStackTest, BatchOne) {
  ErrorStackBatch batch;
  batch.emprace_back(func_fail());
  batch.emprace_back(ErrorStack());
  EXPECT_TRUE(batch.is_error());
  EXPECT_EQ(1U, batch.size());
  ErrorStack summary = SUMMARIZE_ERROR_BATCH(batch);
  EXPECT_EQ(kErrorCodeLogBufInvalidLayout, summary.get_error_code());
}

TEST(ErrorStackTest, BatchMany) {
  ErrorStackBatch batch;
  batch.emprace_back(func_fail());
  batch.emprace_back(ERROR_STACK(func_code_fail()));
  EXPECT_EQ(2U, batch.size());
  ErrorStack summary = SUMMARIZE_ERROR_BATCH(batch);
  EXPECT_EQ(kErrorCodeBatchedError, summary.get_error_code());
  std::string message(summary.get_custom_message());
  EXPECT_NE(std::string::npos, message.find("kErrorCodeLogBufInvalidLayout"));
  EXPECT_NE(std::string::npos, message.find("kErrorCodeLogBufTermFull"));
}

}  // namespace termlog

TEST_MAIN_CAPTURE_SIGNALS(ErrorStackTest, termlog);
