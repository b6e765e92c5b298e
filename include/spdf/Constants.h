/* Copyright (c) 2024-2026 The spdf authors
 *
 * This file is part of spdf.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *   http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#ifndef SPDFCONSTANTS_H
#define SPDFCONSTANTS_H

/* Keep this file 'C' compatible so it can be used from C code. */

/* Exit codes of the spdf CLI and SPDFJob */

enum spdf_exit_code_e {
    spdf_exit_success = 0,
    /* Usage, bootstrap or discovery error; nothing was processed */
    spdf_exit_error = 2,
    /* All items were attempted but at least one ended Failed */
    spdf_exit_item_failed = 3,
};

/* Error codes carried by SPDFExc */

enum spdf_error_code_e {
    spdf_e_success = 0,
    spdf_e_internal,  /* logic error */
    spdf_e_system,    /* I/O error, memory error, etc. */
    spdf_e_bootstrap, /* configuration can't be created or read */
    spdf_e_discovery, /* no work items in batch mode */
    spdf_e_usage,     /* bad command-line usage */
};

/* Stages of the per-item pipeline. The numeric value of the
 * working-artifact stages is also the step number used for
 * snapshot file names. */

enum spdf_stage_e {
    spdf_stage_unlock = 0,
    spdf_stage_sanitize = 1,
    spdf_stage_attachments = 2,
    spdf_stage_metadata = 3,
    spdf_stage_rewrite = 4,
    spdf_stage_relock = 5,
};

/* Key length used when relocking output */

enum spdf_encryption_strength_e {
    spdf_bits_40 = 40,
    spdf_bits_128 = 128,
    spdf_bits_256 = 256,
};

/* Ghostscript pdfwrite quality tiers (-dPDFSETTINGS) */

enum spdf_quality_e {
    spdf_quality_screen,
    spdf_quality_ebook,
    spdf_quality_printer,
    spdf_quality_prepress,
};

#endif /* SPDFCONSTANTS_H */
