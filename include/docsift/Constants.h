// Copyright (c) 2026 The docsift authors
//
// This file is part of docsift.
//
// Licensed under the Apache License, Version 2.0 (the "License"); you may not use this file except
// in compliance with the License. You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software distributed under the License
// is distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express
// or implied. See the License for the specific language governing permissions and limitations under
// the License.

#ifndef DOCSIFT_CONSTANTS_H
#define DOCSIFT_CONSTANTS_H

/*
 * New values must be added to the end of each enumeration so that no constant's numerical value
 * changes between releases.
 */

/* Exit codes from DocSiftJob and the docsift CLI */

enum docsift_exit_code_e {
    docsift_exit_success = 0,
    docsift_exit_error = 2,
    /* Some files in the batch could not be extracted */
    docsift_exit_warning = 3,
};

/* Error codes carried by SiftExc */

enum docsift_error_code_e {
    docsift_e_success = 0,
    docsift_e_internal,                /* logic/programming error -- indicates bug */
    docsift_e_system,                  /* I/O error, memory error, etc. */
    docsift_e_unsupported,             /* valid input but unsupported feature */
    docsift_e_damaged_pdf,             /* syntax errors or other damage in a PDF */
    docsift_e_unsupported_media_type,  /* no extractor is registered for the media type */
    docsift_e_size_exceeded,           /* input is larger than the batch size limit */
    docsift_e_empty_file,              /* input has no bytes */
    docsift_e_ocr,                     /* text recognition provider failure */
    docsift_e_json,                    /* malformed JSON */
};

/* Semantic chunk types */

enum docsift_chunk_type_e {
    dc_heading,
    dc_paragraph,
    dc_table,
    dc_list,
    dc_image,
};

#endif /* DOCSIFT_CONSTANTS_H */
