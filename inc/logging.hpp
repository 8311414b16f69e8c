#pragma once

#include <boost/log/trivial.hpp>
#include <boost/log/sources/severity_channel_logger.hpp>
#include <boost/log/sources/global_logger_storage.hpp>

// sinks are chosen at build time:
//   PDF_OUTLINE_LOG_ENABLE_CONSOLE_SINK    records go to std::clog
//   PDF_OUTLINE_LOG_ENABLE_FILE_SINK       records go to rotating files
//   PDF_OUTLINE_LOG_ENABLE_FILE_LINE_FUNCTION  every record is prefixed with its source location

#ifndef PDF_OUTLINE_LOG_FILENAME_PATTERN
#define PDF_OUTLINE_LOG_FILENAME_PATTERN "pdf_outline_%Y%m%d_%H:%M:%S.%06N.log"
#endif

#ifndef PDF_OUTLINE_LOG_ROTATION_SIZE
#define PDF_OUTLINE_LOG_ROTATION_SIZE 10*1024*1024
#endif

// hour, minute, second of the daily rotation
#ifndef PDF_OUTLINE_LOG_ROTATION_TIME_POINT
#define PDF_OUTLINE_LOG_ROTATION_TIME_POINT 0,0,0
#endif

#ifndef PDF_OUTLINE_LOG_SEVERITY_THRESHOLD
#define PDF_OUTLINE_LOG_SEVERITY_THRESHOLD warning
#endif

// one channel per pipeline stage
#define LOG_CHANNEL_PDF      "pdf"
#define LOG_CHANNEL_LINES    "lines"
#define LOG_CHANNEL_PROFILE  "profile"
#define LOG_CHANNEL_HEADINGS "headings"
#define LOG_CHANNEL_RUNNING  "running"
#define LOG_CHANNEL_DEDUP    "dedup"
#define LOG_CHANNEL_OUTLINE  "outline"
#define LOG_CHANNEL_BATCH    "batch"
#define LOG_CHANNEL_HTTP     "http"

BOOST_LOG_GLOBAL_LOGGER(outline_logger, boost::log::sources::severity_channel_logger_mt<boost::log::trivial::severity_level>)

#ifdef PDF_OUTLINE_LOG_ENABLE_FILE_LINE_FUNCTION
#define PDF_OUTLINE_LOG_LOCATION << "(" << __FILE__ << ":" << __LINE__ << ":" << __FUNCTION__ << ") "
#else
#define PDF_OUTLINE_LOG_LOCATION
#endif

#define LOG(severity) \
    BOOST_LOG_SEV(outline_logger::get(), boost::log::trivial::severity) PDF_OUTLINE_LOG_LOCATION
#define LOG_CHANNEL(channel, severity) \
    BOOST_LOG_CHANNEL_SEV(outline_logger::get(), channel, boost::log::trivial::severity) PDF_OUTLINE_LOG_LOCATION

#define LOG_TRACE   LOG(trace)
#define LOG_DEBUG   LOG(debug)
#define LOG_INFO    LOG(info)
#define LOG_WARNING LOG(warning)
#define LOG_ERROR   LOG(error)
#define LOG_FATAL   LOG(fatal)

#define LOG_CHANNEL_TRACE(channel)   LOG_CHANNEL(channel, trace)
#define LOG_CHANNEL_DEBUG(channel)   LOG_CHANNEL(channel, debug)
#define LOG_CHANNEL_INFO(channel)    LOG_CHANNEL(channel, info)
#define LOG_CHANNEL_WARNING(channel) LOG_CHANNEL(channel, warning)
#define LOG_CHANNEL_ERROR(channel)   LOG_CHANNEL(channel, error)
#define LOG_CHANNEL_FATAL(channel)   LOG_CHANNEL(channel, fatal)
