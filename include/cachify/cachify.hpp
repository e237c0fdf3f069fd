#pragma once

#include "cachify/async_store.hpp"
#include "cachify/cached.hpp"
#include "cachify/config.hpp"
#include "cachify/context.hpp"
#include "cachify/errors.hpp"
#include "cachify/event_loop.hpp"
#include "cachify/listener.hpp"
#include "cachify/lock.hpp"
#include "cachify/memory_store.hpp"
#include "cachify/once.hpp"
#include "cachify/redis_store.hpp"
#include "cachify/task.hpp"
#include "cachify/value.hpp"
#include "cachify/worker_pool.hpp"
