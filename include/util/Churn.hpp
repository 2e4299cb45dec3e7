// Shared counter for processes that vanished or refused access mid-sample
#pragma once

#include <chrono>

namespace tasktop::util {

enum class ChurnKind { Vanished, Denied };

// Record a churn event of a given kind at 'now'.
void note_churn(ChurnKind kind);

// Count events in the last 'ms' milliseconds across all kinds.
[[nodiscard]] int count_recent_ms(int ms);

// Count events in the last 'ms' milliseconds for a specific kind.
[[nodiscard]] int count_recent_kind_ms(ChurnKind kind, int ms);

// Drop all recorded events.
void reset_churn();

} // namespace tasktop::util
