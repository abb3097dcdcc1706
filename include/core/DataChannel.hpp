#pragma once
/** @file  DataChannel.hpp
 *  @brief Sink/source a device publishes samples to.
 *
 *  © 2025 Labrun — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace labrun {
  namespace core {

    /// Receives values on the producing thread (usually an operator's worker).
    class ChannelListener {
    public:
      virtual ~ChannelListener() = default;
      virtual void dataAdded(const std::string& channel, double value) = 0;
      virtual void channelClosed(const std::string&) {}
    };

    class DataChannel {
    public:
      virtual ~DataChannel() = default;

      virtual const std::string& name() const = 0;
      virtual void addData(double value) = 0;
      virtual void close() = 0;
      virtual void subscribe(ChannelListener* listener) = 0;
      virtual void unsubscribe(ChannelListener* listener) = 0;
    };

    /**
 * @class NumericChannel
 * @brief Thread-safe fan-out channel; keeps only a count and the last value.
 *
 *  * `addData()` after `close()` is ignored.
 *  * Listeners are not owned and must unsubscribe before they die.
 */
    class NumericChannel : public DataChannel {
    public:
      explicit NumericChannel(std::string name);

      const std::string& name() const override { return name_; }
      void addData(double value) override;
      void close() override;
      void subscribe(ChannelListener* listener) override;
      void unsubscribe(ChannelListener* listener) override;

      std::size_t count() const;
      std::optional<double> last() const;
      bool closed() const;

    private:
      std::string name_;
      mutable std::mutex mtx_;
      std::vector<ChannelListener*> listeners_;
      std::size_t count_{ 0 };
      std::optional<double> last_{};
      bool closed_{ false };
    };

  } // namespace core
} // namespace labrun
