#pragma once

// Aggregator header for commonly-used core types.
// Instead of including each individual header (e.g. ragdesk_core/types/chunk.hpp),
// users can simply do `#include "ragdesk_core/types.hpp"`.
//
#include "ragdesk_core/types/chunk.hpp"
#include "ragdesk_core/types/context.hpp"
#include "ragdesk_core/types/document.hpp"
