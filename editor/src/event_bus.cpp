#include "Plotline/editor/event_bus.hpp"
#include "Plotline/core/logger.hpp"

#include <algorithm>
#include <exception>

namespace Plotline::editor {

void EventBus::publish(const EditorEvent &event) {
  std::vector<Subscriber> snapshot;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    snapshot = m_subscribers;
    m_dispatchDepth++;
  }

  for (const auto &subscriber : snapshot) {
    if (subscriber.accepts && !subscriber.accepts(event)) {
      continue;
    }

    try {
      subscriber.handler(event);
    } catch (const std::exception &e) {
      PLOTLINE_LOG_ERROR("EventBus: handler failed on '" + event.getDescription() +
                         "': " + e.what());
    }
  }

  bool outermost = false;
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    outermost = --m_dispatchDepth == 0;
  }
  if (outermost) {
    applyDeferredChanges();
  }
}

void EventBus::applyDeferredChanges() {
  std::lock_guard<std::mutex> lock(m_mutex);

  for (auto &sub : m_deferredAdds) {
    m_subscribers.push_back(std::move(sub));
  }
  m_deferredAdds.clear();

  for (u64 id : m_deferredRemovals) {
    std::erase_if(m_subscribers, [id](const Subscriber &sub) { return sub.id == id; });
  }
  m_deferredRemovals.clear();
}

EventSubscription EventBus::addSubscriber(EventFilter accepts, EventHandler handler) {
  if (!handler) {
    return {};
  }

  std::lock_guard<std::mutex> lock(m_mutex);

  Subscriber sub{m_nextSubscriberId++, std::move(accepts), std::move(handler)};
  const u64 id = sub.id;
  if (m_dispatchDepth > 0) {
    m_deferredAdds.push_back(std::move(sub));
  } else {
    m_subscribers.push_back(std::move(sub));
  }
  return EventSubscription(id);
}

EventSubscription EventBus::subscribe(EventHandler handler) {
  return addSubscriber({}, std::move(handler));
}

EventSubscription EventBus::subscribe(EditorEventType type, EventHandler handler) {
  return addSubscriber([type](const EditorEvent &event) { return event.type == type; },
                       std::move(handler));
}

EventSubscription EventBus::subscribe(EventFilter filter, EventHandler handler) {
  return addSubscriber(std::move(filter), std::move(handler));
}

void EventBus::unsubscribe(const EventSubscription &subscription) {
  if (!subscription.isValid()) {
    return;
  }

  const u64 id = subscription.getId();
  std::lock_guard<std::mutex> lock(m_mutex);

  if (m_dispatchDepth > 0) {
    m_deferredRemovals.push_back(id);
    return;
  }
  std::erase_if(m_subscribers, [id](const Subscriber &sub) { return sub.id == id; });
}

usize EventBus::subscriberCount() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_subscribers.size();
}

} // namespace Plotline::editor
