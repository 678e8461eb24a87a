// core_pch.h : include file for standard system include files,
// or project specific include files that are used frequently, but
// are changed infrequently
//
#pragma once

#if defined(_WINDOWS)
#pragma warning (disable : 4267)
#pragma warning (disable : 4244)
#pragma warning (disable : 4503)
#endif

#include <string>
#include <vector>
#include <utility>
#include <algorithm>
#include <numeric>
#include <functional>
#include <iterator>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <future>
#include <thread>
#include <exception>
#include <memory>

#include <armadillo>
#include <dlib/logger.h>
#include <dlib/statistics.h>
#include <boost/math/distributions/normal.hpp>
#include <boost/math/distributions/beta.hpp>
