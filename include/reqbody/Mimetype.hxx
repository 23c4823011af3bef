// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

/*
 * Content types announced by reqbody content sources.
 */

#pragma once

#define REQBODY_MIMETYPE_OCTET_STREAM "application/octet-stream"
#define REQBODY_MIMETYPE_TEXT_PLAIN "text/plain"
#define REQBODY_MIMETYPE_TEXT_PLAIN_UTF8 REQBODY_MIMETYPE_TEXT_PLAIN "; charset=UTF-8"

/**
 * The default chunk size for ContentSplitter if the configuration
 * does not specify one.
 */
#define REQBODY_DEFAULT_CHUNK_SIZE (8 * 1024 * 1024)

/**
 * The default memory ceiling for ContentSplitter.
 */
#define REQBODY_DEFAULT_MAX_MEMORY (4 * REQBODY_DEFAULT_CHUNK_SIZE)
