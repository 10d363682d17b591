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
#include <stdint.h>
#include <gtest/gtest.h>

#include <cstdio>
#include <sstream>
#include <string>

#include "termlog/error_stack.hpp"
#include "termlog/termlog_options.hpp"
#include "termlog/test_common.hpp"
#include "termlog/logbuf/log_buffer_descriptor.hpp"

/**
 * @file test_termlog_options.cpp
 * Testcases for TermlogOptions.
 */
namespace termlog {
DEFINE_TEST_CASE_PACKAGE(TermlogOptionsTest, termlog);

TEST(TermlogOptionsTest, Instantiate) {
  TermlogOptions options;
  EXPECT_EQ(logbuf::LogBufferOptions::kDefaultTermLength, options.log_buffer_.term_length_);
  EXPECT_EQ(logbuf::compute_log_length(logbuf::LogBufferOptions::kDefaultTermLength),
    options.calculate_required_memory());
}

TEST(TermlogOptionsTest, Copy) {
  TermlogOptions options = get_tiny_options();
  options.log_buffer_.initial_term_id_ = 77;
  options.debugging_.verbose_modules_ = "log_buffer=2";

  TermlogOptions copied(options);
  EXPECT_EQ(logbuf::kTermMinLength, copied.log_buffer_.term_length_);
  EXPECT_EQ(77, copied.log_buffer_.initial_term_id_);
  EXPECT_FALSE(copied.log_buffer_.randomize_initial_term_id_);
  EXPECT_EQ(std::string("log_buffer=2"), copied.debugging_.verbose_modules_);

  TermlogOptions assigned;
  assigned = options;
  EXPECT_EQ(77, assigned.log_buffer_.initial_term_id_);
  EXPECT_EQ(197056U, assigned.calculate_required_memory());
}

TEST(TermlogOptionsTest, Print) {
  TermlogOptions options = get_tiny_options();
  std::stringstream str;
  str << options;
  EXPECT_NE(std::string::npos, str.str().find("<TermlogOptions>"));
  EXPECT_NE(std::string::npos, str.str().find("<DebuggingOptions>"));
  EXPECT_NE(std::string::npos, str.str().find("<LogBufferOptions>"));
  EXPECT_NE(std::string::npos, str.str().find("<term_length_>65536</term_length_>"));
}

TEST(TermlogOptionsTest, SaveLoadFile) {
  std::string path = get_random_tmp_file_path("termlog_options.xml");
  TermlogOptions options = get_tiny_options();
  options.log_buffer_.initial_term_id_ = -3;
  options.log_buffer_.term_length_ = 1U << 16;
  options.debugging_.verbose_log_level_ = 2;
  EXPECT_FALSE(options.save_to_file(path).is_error());

  TermlogOptions loaded;
  EXPECT_FALSE(loaded.load_from_file(path).is_error());
  EXPECT_EQ(-3, loaded.log_buffer_.initial_term_id_);
  EXPECT_EQ(1U << 16, loaded.log_buffer_.term_length_);
  EXPECT_FALSE(loaded.log_buffer_.randomize_initial_term_id_);
  EXPECT_EQ(2, loaded.debugging_.verbose_log_level_);
  EXPECT_TRUE(loaded.debugging_.debug_log_to_stderr_);
  std::remove(path.c_str());
}

TEST(TermlogOptionsTest, FileNotFound) {
  TermlogOptions options;
  ErrorStack ret = options.load_from_file(get_random_tmp_file_path("not_exist.xml"));
  EXPECT_EQ(kErrorCodeConfFileNotFound, ret.get_error_code());
}

TEST(TermlogOptionsTest, Broken) {
  TermlogOptions options;
  EXPECT_EQ(kErrorCodeConfParseFailed,
    options.load_from_string("<TermlogOptions><LogBuf").get_error_code());
  EXPECT_EQ(kErrorCodeConfParseFailed, options.load_from_string("").get_error_code());
  EXPECT_EQ(kErrorCodeConfEmptyXml,
    options.load_from_string("<!-- no element -->").get_error_code());
}

TEST(TermlogOptionsTest, MissingChild) {
  TermlogOptions original = get_tiny_options();
  std::stringstream str;
  str << original.debugging_;
  std::string xml = std::string("<TermlogOptions>") + str.str() + "</TermlogOptions>";
  TermlogOptions options;
  EXPECT_EQ(kErrorCodeConfMissingElement, options.load_from_string(xml).get_error_code());
}

}  // namespace termlog

TEST_MAIN_CAPTURE_SIGNALS(TermlogOptionsTest, termlog);
