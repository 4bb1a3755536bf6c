/**
 * @file streamcsv.h
 * @brief streamcsv - Incremental CSV tokenizer for chunked byte streams.
 * @version 0.1.0
 *
 * This is the main public header for the streamcsv library. Include this
 * single header to access all public functionality.
 */

#ifndef STREAMCSV_H
#define STREAMCSV_H

#define STREAMCSV_VERSION_MAJOR 0
#define STREAMCSV_VERSION_MINOR 1
#define STREAMCSV_VERSION_PATCH 0
#define STREAMCSV_VERSION_STRING "0.1.0"

#include "streamcsv/dialect.h"
#include "streamcsv/encoding.h"
#include "streamcsv/error.h"
#include "streamcsv/options.h"
#include "streamcsv/row.h"
#include "streamcsv/stream_parser.h"
#include "streamcsv/stream_reader.h"

#endif // STREAMCSV_H
