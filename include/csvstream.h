/**
 * @file csvstream.h
 * @brief Umbrella header for the csvstream library.
 *
 * csvstream reads and writes CSV records asynchronously over pluggable byte
 * sources and sinks. Parsing is incremental: records are produced as bytes
 * arrive, without loading the whole input.
 *
 * @code
 * #include <csvstream.h>
 *
 * csvstream::RecordWriter writer("out.csv");
 * writer.write_row(csvstream::Record{"name", "value"}).get();
 * writer.close().get();
 *
 * csvstream::RecordReader reader("out.csv");
 * for (const auto& record : reader) {
 *     // record is a std::vector<std::string>
 * }
 * @endcode
 */

#ifndef CSVSTREAM_H
#define CSVSTREAM_H

#include "csvstream/byte_stream.h"
#include "csvstream/debug.h"
#include "csvstream/dialect.h"
#include "csvstream/dict.h"
#include "csvstream/error.h"
#include "csvstream/reader.h"
#include "csvstream/serializer.h"
#include "csvstream/tokenizer.h"
#include "csvstream/types.h"
#include "csvstream/writer.h"

#define CSVSTREAM_VERSION_MAJOR 0
#define CSVSTREAM_VERSION_MINOR 1
#define CSVSTREAM_VERSION_PATCH 0

#endif // CSVSTREAM_H
