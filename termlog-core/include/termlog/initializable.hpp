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
#ifndef TERMLOG_INITIALIZABLE_HPP_
#define TERMLOG_INITIALIZABLE_HPP_

#include "termlog/cxx11.hpp"
#include "termlog/error_stack.hpp"

namespace termlog {

/**
 * @defgroup INITIALIZABLE Initialize/Uninitialize Semantics
 * @ingroup IDIOMS
 * @brief Two-phase setup and teardown for objects that acquire non-trivial resources.
 * @details
 * Constructors cannot return an ErrorStack and destructors cannot propagate one, so every
 * long-living object (LogBuffer, LogBufferMemory, DebuggingSupports, Stream) acquires its
 * resources in initialize() and releases them in uninitialize().
 * The destructor does \b not call uninitialize(); the owner does, and checks the result.
 *
 * @par DefaultInitializable
 * Derive from DefaultInitializable and define initialize_once()/uninitialize_once().
 * @code{.cpp}
 * ErrorStack LogBuffer::initialize_once() {
 *   CHECK_ERROR(validate_term_region(regions_.term_regions_[0]));
 *   ...
 *   return kRetOk;
 * }
 * @endcode
 * If initialize_once() fails, uninitialize_once() is called to release what was acquired.
 *
 * @par UninitializeGuard
 * A scope guard that calls uninitialize() on an early return. It cannot propagate the error
 * out of the destructor, so it aborts or prints to stderr depending on the policy. Always call
 * uninitialize() explicitly; the guard is a safety net.
 */

/**
 * The pure-virtual interface to initialize/uninitialize non-trivial resources.
 * @ingroup INITIALIZABLE
 */
class Initializable {
 public:
  virtual ~Initializable() {}

  /**
   * @brief Acquires resources in this object, usually called right after constructor.
   * @pre is_initialized() == false
   * @details
   * is_initialized() becomes true if and only if this returns no error.
   * Not thread-safe.
   */
  virtual ErrorStack  initialize() = 0;

  virtual bool        is_initialized() const = 0;

  /**
   * @brief \e Idempotent. Releases all resources of this object, if any.
   * @details
   * Makes the best effort to release everything even after an error, and reports all of
   * the errors as one ErrorStackBatch summary.
   * Not thread-safe. NOT called from the destructor.
   */
  virtual ErrorStack  uninitialize() = 0;
};

/**
 * @brief Typical implementation of Initializable as a skeleton base class.
 * @ingroup INITIALIZABLE
 * @details
 * Defines initialize()/uninitialize() with initialize-once semantics on top of
 * initialize_once()/uninitialize_once(). Not copiable.
 */
class DefaultInitializable : public virtual Initializable {
 public:
  DefaultInitializable() : initialized_(false) {}
  virtual ~DefaultInitializable() {}

  DefaultInitializable(const DefaultInitializable&) CXX11_FUNC_DELETE;
  DefaultInitializable& operator=(const DefaultInitializable&) CXX11_FUNC_DELETE;

  ErrorStack  initialize() CXX11_OVERRIDE CXX11_FINAL {
    if (is_initialized()) {
      return ERROR_STACK(kErrorCodeAlreadyInitialized);
    }
    ErrorStack init_error = initialize_once();
    if (init_error.is_error()) {
      // release what we acquired before the failure.
      CHECK_ERROR(uninitialize_once());
      return init_error;
    }
    initialized_ = true;
    return kRetOk;
  }

  ErrorStack  uninitialize() CXX11_OVERRIDE CXX11_FINAL {
    if (!is_initialized()) {
      return kRetOk;
    }
    ErrorStack uninit_error = uninitialize_once();
    initialized_ = false;
    return uninit_error;
  }

  bool        is_initialized() const CXX11_OVERRIDE CXX11_FINAL {
    return initialized_;
  }

  virtual ErrorStack  initialize_once() = 0;
  virtual ErrorStack  uninitialize_once() = 0;

 private:
  bool    initialized_;
};

/**
 * @brief Scope guard that uninitializes its target on an early return.
 * @ingroup INITIALIZABLE
 * @details
 * A destructor has nowhere to return an error to, so a failed uninitialize() here is either
 * fatal or only reported on stderr, depending on the policy. Normal paths still call
 * uninitialize() explicitly and check its result.
 */
class UninitializeGuard {
 public:
  enum Policy {
    /** Dumps the error and aborts if uninitialize() fails. */
    kAbortIfUninitializeError = 0,
    /** Reports the error on stderr if uninitialize() fails. */
    kWarnIfUninitializeError,
  };
  explicit UninitializeGuard(Initializable *target, Policy policy = kAbortIfUninitializeError)
    : target_(target), policy_(policy) {}
  ~UninitializeGuard();

 private:
  Initializable*  target_;
  Policy          policy_;
};

}  // namespace termlog
#endif  // TERMLOG_INITIALIZABLE_HPP_
