#pragma once

// Umbrella header for the cohere engine.

#include "cohere/log.hpp"
#include "cohere/error.hpp"
#include "cohere/types.hpp"
#include "cohere/version.hpp"
#include "cohere/clock.hpp"
#include "cohere/scheduler.hpp"
#include "cohere/channel.hpp"
#include "cohere/observation.hpp"
#include "cohere/view.hpp"
#include "cohere/entity_cache.hpp"
#include "cohere/remote.hpp"
#include "cohere/mock_remote_store.hpp"
#include "cohere/db.hpp"
#include "cohere/sqlite_remote_store.hpp"
#include "cohere/config.hpp"
#include "cohere/optimistic.hpp"
#include "cohere/batch.hpp"
#include "cohere/undo.hpp"
#include "cohere/conflict.hpp"
#include "cohere/reconciler.hpp"
#include "cohere/staleness.hpp"
#include "cohere/query.hpp"
#include "cohere/engine.hpp"
