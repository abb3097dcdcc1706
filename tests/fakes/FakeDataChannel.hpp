#pragma once
/** @file  FakeDataChannel.hpp
 *  @brief DataChannel that keeps every value it receives.
 *
 *  © 2025 Labrun — MIT-licensed.
 */

#include <cstddef>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "core/DataChannel.hpp"

namespace labrun {
  namespace test {

    class FakeDataChannel : public labrun::core::DataChannel {
    public:
      explicit FakeDataChannel(std::string name = "fake") : name_(std::move(name)) {}

      const std::string& name() const override { return name_; }

      void addData(double value) override {
        std::lock_guard<std::mutex> lock(mtx_);
        values_.push_back(value);
      }

      void close() override {
        std::lock_guard<std::mutex> lock(mtx_);
        closed_ = true;
      }

      void subscribe(labrun::core::ChannelListener*) override {}
      void unsubscribe(labrun::core::ChannelListener*) override {}

      std::vector<double> values() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return values_;
      }

      std::size_t count() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return values_.size();
      }

    private:
      std::string name_;
      mutable std::mutex mtx_;
      std::vector<double> values_;
      bool closed_{ false };
    };

  } // namespace test
} // namespace labrun
