#pragma once

#include "pivot/analyzer.hpp"
#include "pivot/artifacts.hpp"
#include "pivot/benchmark.hpp"
#include "pivot/cache.hpp"
#include "pivot/config.hpp"
#include "pivot/interpreter.hpp"
#include "pivot/parity.hpp"
#include "pivot/pipeline.hpp"
#include "pivot/stats.hpp"
#include "pivot/synthesizer.hpp"
