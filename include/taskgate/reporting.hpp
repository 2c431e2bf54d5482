#pragma once
#include "task.hpp"
#include <iosfwd>

namespace taskgate {
namespace reporting {

void set_csv(bool value);
bool csv_enabled();

// One line per finished attempt: text "[RESULT] ..." or CSV
// (id,status,attempts,failure,msg,time_ms).
void report_result(const Task& task);

void print_summary(const PlanSummary& summary, std::ostream& os);

} // namespace reporting
} // namespace taskgate
