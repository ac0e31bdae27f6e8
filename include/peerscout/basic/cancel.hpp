/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

namespace peerscout {

  /**
   * Type-erased action performed on destruction
   */
  class CancelDtor {
   public:
    virtual ~CancelDtor() = default;
  };

  /**
   * RAII handle of an asynchronous operation: destroying (or resetting) the
   * handle cancels the operation. Empty handle means "not cancellable"
   */
  using Cancel = std::unique_ptr<CancelDtor>;

  template <typename F>
  class CancelDtorFn final : public CancelDtor {
   public:
    explicit CancelDtorFn(F f) : f_{std::move(f)} {}

    ~CancelDtorFn() override {
      f_();
    }

    CancelDtorFn(const CancelDtorFn &) = delete;
    CancelDtorFn &operator=(const CancelDtorFn &) = delete;
    CancelDtorFn(CancelDtorFn &&) = delete;
    CancelDtorFn &operator=(CancelDtorFn &&) = delete;

   private:
    F f_;
  };

  /// Makes handle which calls @param fn on cancellation
  Cancel cancelFn(auto fn) {
    return std::make_unique<CancelDtorFn<decltype(fn)>>(std::move(fn));
  }

}  // namespace peerscout
