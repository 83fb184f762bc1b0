#pragma once
#include <lull/version.hpp>

#include <lull/core/logger.hpp>
#include <lull/core/config.hpp>
#include <lull/core/subscription.hpp>
#include <lull/core/cancellation.hpp>
#include <lull/core/scheduler.hpp>
#include <lull/core/thread_pool.hpp>
#include <lull/core/clock.hpp>
#include <lull/core/virtual_clock.hpp>
#include <lull/core/timer_thread.hpp>
#include <lull/core/pending_task.hpp>

#include <lull/core/observable.hpp>
#include <lull/core/subject.hpp>

#include <lull/ops/map.hpp>
#include <lull/ops/delay.hpp>
#include <lull/ops/debounce_latest.hpp>
