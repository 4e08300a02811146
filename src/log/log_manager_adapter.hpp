#pragma once

#include "refpool/log/ilog_manager.hpp"

namespace refpool {
namespace log {

// ILogManager view of the process-wide LogManager. Every instance shares the
// same glog state; Release() only frees the view.
ILogManager* NewLogManagerAdapter();

}  // namespace log
}  // namespace refpool
