#pragma once

/**
 * @file event_bus.hpp
 * @brief Publish/subscribe bus for editor events
 *
 * Components publish EditorEvent subclasses; subscribers filter by event
 * type, by a custom predicate or by C++ type. Subscribing or unsubscribing
 * from inside a handler is allowed: the change is held back until the
 * outermost dispatch returns.
 *
 * The bus only carries outbound notifications. Components never react to
 * each other through it, so several workspaces may share one bus.
 */

#include "Plotline/core/types.hpp"

#include <chrono>
#include <concepts>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace Plotline::editor {

enum class EditorEventType : u8 {
  // Graph structure
  NodeAdded,
  NodeRemoved,
  NodeUpdated,
  NodeMoved,
  EdgeAdded,
  EdgeRemoved,
  EdgeUpdated,
  HistoryRestored,

  // Interaction
  SelectionChanged,
  LayoutApplied,
  EdgeCreationFinished,

  // Branching
  BranchChanged,
  ImpactPreviewUpdated,

  Custom
};

/**
 * @brief Base class of every event travelling on the bus
 */
struct EditorEvent {
  EditorEventType type;
  u64 timestamp = 0; ///< steady-clock nanoseconds at construction
  std::string source;

  explicit EditorEvent(EditorEventType eventType)
      : type(eventType),
        timestamp(static_cast<u64>(std::chrono::duration_cast<std::chrono::nanoseconds>(
                                       std::chrono::steady_clock::now().time_since_epoch())
                                       .count())) {}

  virtual ~EditorEvent() = default;

  EditorEvent(const EditorEvent&) = default;
  EditorEvent& operator=(const EditorEvent&) = default;

  /**
   * @brief Human-readable one-liner used in log messages
   */
  [[nodiscard]] virtual std::string getDescription() const {
    return "EditorEvent(" + std::to_string(static_cast<int>(type)) + ")";
  }
};

/**
 * @brief Handle returned by subscribe(); pass it back to unsubscribe()
 */
class EventSubscription {
public:
  EventSubscription() = default;
  explicit EventSubscription(u64 id) : m_id(id) {}

  [[nodiscard]] u64 getId() const { return m_id; }
  [[nodiscard]] bool isValid() const { return m_id != 0; }

private:
  u64 m_id = 0;
};

using EventHandler = std::function<void(const EditorEvent&)>;
using EventFilter = std::function<bool(const EditorEvent&)>;

class EventBus {
public:
  EventBus() = default;
  ~EventBus() = default;

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  /**
   * @brief Deliver @p event to every matching subscriber before returning
   *
   * A handler that throws is logged and skipped; the rest still run.
   */
  void publish(const EditorEvent& event);

  EventSubscription subscribe(EventHandler handler);
  EventSubscription subscribe(EditorEventType type, EventHandler handler);
  EventSubscription subscribe(EventFilter filter, EventHandler handler);

  /**
   * @brief Subscribe to one concrete event class
   */
  template <typename T>
    requires std::derived_from<T, EditorEvent>
  EventSubscription subscribe(std::function<void(const T&)> handler) {
    return subscribe(
        [](const EditorEvent& event) { return dynamic_cast<const T*>(&event) != nullptr; },
        [handler = std::move(handler)](const EditorEvent& event) {
          handler(static_cast<const T&>(event));
        });
  }

  void unsubscribe(const EventSubscription& subscription);

  [[nodiscard]] usize subscriberCount() const;

private:
  struct Subscriber {
    u64 id = 0;
    EventFilter accepts; ///< empty: every event
    EventHandler handler;
  };

  EventSubscription addSubscriber(EventFilter accepts, EventHandler handler);
  void applyDeferredChanges();

  std::vector<Subscriber> m_subscribers;

  // Held back while m_dispatchDepth > 0
  std::vector<Subscriber> m_deferredAdds;
  std::vector<u64> m_deferredRemovals;

  mutable std::mutex m_mutex;
  u64 m_nextSubscriberId = 1;
  i32 m_dispatchDepth = 0;
};

} // namespace Plotline::editor
