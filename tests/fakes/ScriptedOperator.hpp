#pragma once
/** @file  ScriptedOperator.hpp
 *  @brief Operator whose prepare/finalize bodies are supplied by the test.
 *
 *  © 2025 Labrun — MIT-licensed.
 */

#include <functional>
#include <memory>
#include <utility>

#include <nlohmann/json.hpp>

#include "core/Operator.hpp"
#include "core/OperatorRuntime.hpp"
#include "core/WorkerContext.hpp"

namespace labrun {
  namespace test {

    class ScriptedOperator : public labrun::core::Operator {
    public:
      using PrepareFn = std::function<nlohmann::json(ScriptedOperator&, const nlohmann::json&)>;
      using FinalizeFn = std::function<void(ScriptedOperator&)>;

      ScriptedOperator(nlohmann::json args, PrepareFn onPrepare, FinalizeFn onFinalize)
          : Operator(std::move(args)), onPrepare_(std::move(onPrepare)),
            onFinalize_(std::move(onFinalize)) {}

      using Operator::worker; // prepare bodies may start timers

    protected:
      nlohmann::json prepare(const nlohmann::json& args) override {
        return onPrepare_ ? onPrepare_(*this, args) : nlohmann::json::object();
      }

      void finalize() override {
        if (onFinalize_)
          onFinalize_(*this);
      }

    private:
      PrepareFn onPrepare_;
      FinalizeFn onFinalize_;
    };

    /// Factory for OperatorRuntime::activate() building a ScriptedOperator.
    inline labrun::core::OperatorRuntime::Factory
    scripted(ScriptedOperator::PrepareFn onPrepare, ScriptedOperator::FinalizeFn onFinalize = {}) {
      return [onPrepare, onFinalize](nlohmann::json args) {
        return std::make_unique<ScriptedOperator>(std::move(args), onPrepare, onFinalize);
      };
    }

  } // namespace test
} // namespace labrun
