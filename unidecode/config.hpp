// SPDX-License-Identifier: GPL-2.0-only
// Copyright 2025 Jaroslav Rohel, jaroslav.rohel@gmail.com

#ifndef _UNIDECODE_CONFIG_HPP_
#define _UNIDECODE_CONFIG_HPP_

// Directory with page tables used by the command line tool when `--tables-dir` is not given
#ifndef UNIDECODE_TABLES_DIR
#if defined(_WIN32)
#define UNIDECODE_TABLES_DIR "tables"
#else
#define UNIDECODE_TABLES_DIR "/usr/share/unidecode/tables"
#endif
#endif

// File name extension of page table files, "x1f6" + UNIDECODE_PAGE_FILE_EXT
#ifndef UNIDECODE_PAGE_FILE_EXT
#define UNIDECODE_PAGE_FILE_EXT ".txt"
#endif

#endif
