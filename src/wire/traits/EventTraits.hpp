#pragma once

#include <type_traits>
#include "../common/Events.hpp"

namespace wire::traits
{

template <typename... Ts>
struct EventList
{
};

// ===================== 已注册事件 =====================
using RegisteredEvents = EventList<events::DiagnosticReported>;

template <typename T, typename List>
inline constexpr bool is_registered_v = false;

template <typename T, typename... Ts>
inline constexpr bool is_registered_v<T, EventList<Ts...>> = (std::is_same_v<T, Ts> || ...);

// ===================== 事件检测 =====================

template <typename T>
concept Events = is_registered_v<std::remove_cvref_t<T>, RegisteredEvents> && requires {
    typename std::remove_cvref_t<T>::is_event_tag;
};

} // namespace wire::traits
