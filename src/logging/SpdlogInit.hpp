#pragma once

/**
 * Initializes spdlog as the backend of the LOG() macros.
 *
 * Installs a colored stderr logger named "logstream" with the "[%L] %v"
 * pattern. Safe to call more than once; later calls only adjust the level.
 *
 * @param verbose When true, DLOG-level (debug) messages are emitted too.
 */
extern void LogStream_SpdlogInit(bool verbose = false);

// Deregister and cleanup spdlog
extern void LogStream_SpdlogDeInit();
