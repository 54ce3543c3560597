#pragma once

/**
 * @file capprobe.hpp
 * @brief Umbrella header for the capability-probing library
 *
 * - probe.hpp: what to check (executable, static file, composite)
 * - prober.hpp: evaluating probes, with caching
 * - latex.hpp: the LaTeX toolchain catalogue
 */

#include "capprobe/config.hpp"
#include "capprobe/exec.hpp"
#include "capprobe/latex.hpp"
#include "capprobe/probe.hpp"
#include "capprobe/probe_cache.hpp"
#include "capprobe/prober.hpp"
#include "capprobe/registry.hpp"
#include "capprobe/resolver.hpp"
#include "capprobe/result.hpp"
#include "capprobe/scratch.hpp"
#include "capprobe/search_path.hpp"
#include "capprobe/types.hpp"
