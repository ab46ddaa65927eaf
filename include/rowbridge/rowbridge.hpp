#pragma once

/// Convenience umbrella header for the rowbridge library.

#include <rowbridge/codec/batch_codec.hpp>
#include <rowbridge/convert/create.hpp>
#include <rowbridge/convert/row_converter.hpp>
#include <rowbridge/core/data_type.hpp>
#include <rowbridge/core/dataset.hpp>
#include <rowbridge/core/error.hpp>
#include <rowbridge/core/format.hpp>
#include <rowbridge/core/schema.hpp>
#include <rowbridge/core/value.hpp>
#include <rowbridge/frame/rename.hpp>
#include <rowbridge/frame/transform.hpp>
#include <rowbridge/io/csv.hpp>
#include <rowbridge/io/persist.hpp>
