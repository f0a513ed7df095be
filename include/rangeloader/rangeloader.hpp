#ifndef RANGELOADER_HPP
#define RANGELOADER_HPP

// Project version
#define RANGELOADER_VERSION_MAJOR 0
#define RANGELOADER_VERSION_MINOR 3
#define RANGELOADER_VERSION_PATCH 0

#include <rangeloader/export.hpp>
#include <rangeloader/deadline.hpp>
#include <rangeloader/errors.hpp>
#include <rangeloader/options.hpp>
#include <rangeloader/byte_range.hpp>
#include <rangeloader/sink.hpp>
#include <rangeloader/transport.hpp>
#include <rangeloader/client.hpp>

#endif
