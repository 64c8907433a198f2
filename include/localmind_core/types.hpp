#pragma once

// Aggregator header for the core data types.
#include "localmind_core/types/chunk.hpp"
#include "localmind_core/types/conversation.hpp"
#include "localmind_core/types/document.hpp"
#include "localmind_core/types/tool_call.hpp"
