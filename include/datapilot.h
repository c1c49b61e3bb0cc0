/**
 * @file datapilot.h
 * @brief Umbrella header for the datapilot tabular ingestion library.
 *
 * datapilot turns delimited text of unknown dialect and encoding into a
 * uniform stream of rows:
 * - encoding.h: BOM and statistical encoding detection, UTF-8 transcoding
 * - dialect.h: delimiter, quote, header and line-ending detection
 * - streaming.h: chunk-resumable row state machine
 * - delimited_parser.h: CSV/TSV format adapter
 * - format_registry.h: format selection by confidence
 *
 * @example
 * @code
 * #include "datapilot.h"
 *
 * datapilot::FormatRegistry registry;
 * datapilot::register_builtin_formats(registry);
 * auto selection = registry.get_parser("data.csv");
 * for (const auto& row : selection.parser->parse_file("data.csv")) {
 *     std::cout << row.fields.size() << "\n";
 * }
 * @endcode
 */

#ifndef DATAPILOT_H
#define DATAPILOT_H

#include "datapilot/delimited_parser.h"
#include "datapilot/dialect.h"
#include "datapilot/encoding.h"
#include "datapilot/error.h"
#include "datapilot/format_parser.h"
#include "datapilot/format_registry.h"
#include "datapilot/logging.h"
#include "datapilot/options.h"
#include "datapilot/source.h"
#include "datapilot/streaming.h"
#include "datapilot/types.h"

#define DATAPILOT_VERSION_MAJOR 0
#define DATAPILOT_VERSION_MINOR 1
#define DATAPILOT_VERSION_PATCH 0

#endif // DATAPILOT_H
