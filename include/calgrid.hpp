#pragma once

// calgrid - calendar-aligned time interval generation
//
// Splits a time range into one interval per hour/day/week/month/quarter/year,
// aligned to a fixed UTC offset, returned as UTC instants.

#include "calgrid/boundary.hpp"
#include "calgrid/duration.hpp"
#include "calgrid/expected.hpp"
#include "calgrid/generator_config.hpp"
#include "calgrid/grouping.hpp"
#include "calgrid/instant.hpp"
#include "calgrid/interval.hpp"
#include "calgrid/interval_generator.hpp"
#include "calgrid/intervals.hpp"
#include "calgrid/time_error.hpp"
