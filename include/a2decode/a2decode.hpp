#ifndef A2DECODE_A2DECODE_HPP_
#define A2DECODE_A2DECODE_HPP_

#include <a2decode/a2decode_export.h>
#include <a2decode/types.hpp>
#include <a2decode/byte_reader.hpp>
#include <a2decode/surface.hpp>
#include <a2decode/palettes.hpp>
#include <a2decode/classify.hpp>
#include <a2decode/archive/inflate.hpp>
#include <a2decode/archive/gzip.hpp>
#include <a2decode/archive/zip.hpp>
#include <a2decode/archive/binary2.hpp>
#include <a2decode/catalog/file_types.hpp>
#include <a2decode/catalog/disk_image.hpp>
#include <a2decode/catalog/catalog.hpp>
#include <a2decode/catalog/prodos.hpp>
#include <a2decode/catalog/dos33.hpp>
#include <a2decode/catalog/pascal.hpp>
#include <a2decode/basic/detokenizer.hpp>
#include <a2decode/document/appleworks.hpp>
#include <a2decode/document/resource_fork.hpp>
#include <a2decode/document/text.hpp>
#include <a2decode/raster/apple2_graphics.hpp>
#include <a2decode/raster/macpaint.hpp>
#include <a2decode/raster/iigs_icon.hpp>
#include <a2decode/raster/png.hpp>

namespace a2decode {

// All public API is included via the headers above.
// See:
//   - types.hpp:     decode_error, decode_result, shared_bytes, date_time
//   - classify.hpp:  content_kind, classify()
//   - archive/*.hpp: gzip and ZIP readers over an injectable inflate, Binary II
//   - catalog/*.hpp: disk images, filesystem registry, walk_catalog()
//   - basic/*.hpp:   Applesoft and Integer BASIC detokenizers
//   - document/*:    AppleWorks and Teach documents, Apple II text, Merlin source
//   - raster/*.hpp:  Apple II / IIgs / MacPaint pictures, icons, PNG export

} // namespace a2decode

#endif // A2DECODE_A2DECODE_HPP_
