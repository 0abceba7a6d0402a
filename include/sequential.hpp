#pragma once

/*
===============================================================================
sequential: Public API Entry Point
===============================================================================

Header-only monotonic sequence number generator.

This header pulls in the generator and its numeric capability only. The
optional JSON state codec (and its simdjson dependency) lives behind
<sequential/codec/json.hpp>.
===============================================================================
*/

#include <sequential/seq_num.hpp>
#include <sequential/error.hpp>
#include <sequential/state.hpp>
#include <sequential/sequence.hpp>
