// Copyright (c) 2024-2026 The spdf authors
//
// This file is part of spdf.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//   http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#ifndef SUTIL_HH
#define SUTIL_HH

#include <spdf/DLL.h>

#include <cstdio>
#include <list>
#include <string>
#include <vector>

class Pipeline;

namespace SUtil
{
    // This is a collection of useful utility functions that don't
    // really go anywhere else.
    SPDF_DLL
    std::string int_to_string(long long, int length = 0);

    // Parse a decimal integer. Throws std::runtime_error if the string
    // is not entirely a base-10 integer or doesn't fit in an int.
    SPDF_DLL
    int string_to_int(char const* str);

    // Returns true iff the string is a complete base-10 integer.
    SPDF_DLL
    bool is_number(char const* str);

    // Throw SPDFSystemError with the given description and the value
    // of errno.
    SPDF_DLL
    void throw_system_error(std::string const& description);

    // The status argument is assumed to be the return value of a
    // standard library call that sets errno when it fails. If status
    // is -1, convert the current value of errno to an SPDFSystemError
    // that includes the description. Otherwise, return status.
    SPDF_DLL
    int os_wrapper(std::string const& description, int status);

    // If the open fails, throws SPDFSystemError. Otherwise, the FILE*
    // is returned.
    SPDF_DLL
    FILE* safe_fopen(char const* filename, char const* mode);

    // The FILE* argument is assumed to be the return of fopen. If
    // null, throw SPDFSystemError. Otherwise, return the FILE*.
    SPDF_DLL
    FILE* fopen_wrapper(std::string const&, FILE*);

    // This is a little class to help with automatic closing of files.
    // You can do something like
    //
    // SUtil::FileCloser fc(SUtil::safe_fopen(filename, "rb"));
    //
    // and then use fc.f to the file. Be sure to actually declare a
    // variable of type FileCloser.
    class FileCloser
    {
      public:
        FileCloser(FILE* f) :
            f(f)
        {
        }

        ~FileCloser()
        {
            if (f) {
                fclose(f);
                f = nullptr;
            }
        }

        FILE* f;
    };

    // Returns true if a file can be opened for reading.
    SPDF_DLL
    bool file_can_be_opened(char const* filename);

    SPDF_DLL
    bool file_exists(std::string const& path);

    SPDF_DLL
    bool is_directory(std::string const& path);

    SPDF_DLL
    void remove_file(char const* path);

    // rename_file will overwrite newname if it exists
    SPDF_DLL
    void rename_file(char const* oldname, char const* newname);

    // Like rename_file, but falls back to copy and remove when the two
    // names are on different file systems.
    SPDF_DLL
    void move_file(char const* oldname, char const* newname);

    // Copy the contents of from to to, replacing to if it exists.
    SPDF_DLL
    void copy_file(char const* from, char const* to);

    // Write the contents of filename to the given pipeline and call
    // finish on the pipeline.
    SPDF_DLL
    void pipe_file(char const* filename, Pipeline* p);

    // Create a directory and any missing parents. Existing
    // directories are not an error.
    SPDF_DLL
    void make_directories(std::string const& path);

    // Remove a file or a directory tree. A path that doesn't exist is
    // not an error.
    SPDF_DLL
    void remove_tree(std::string const& path);

    // Return the regular files directly inside dir, sorted.
    SPDF_DLL
    std::vector<std::string> list_files(std::string const& dir);

    // Return the regular files anywhere below dir as paths relative to
    // dir, sorted lexicographically.
    SPDF_DLL
    std::vector<std::string> list_files_recursive(std::string const& dir);

    // The final path component, ignoring trailing separators.
    SPDF_DLL
    std::string path_basename(std::string const& filename);

    // Everything before the final path component, or the empty string
    // if there is no directory part.
    SPDF_DLL
    std::string path_dirname(std::string const& filename);

    // The final path component without its last extension.
    SPDF_DLL
    std::string path_stem(std::string const& filename);

    // The last extension including the dot, or the empty string.
    SPDF_DLL
    std::string path_extension(std::string const& filename);

    // Join two path fragments with a single separator. An empty
    // fragment yields the other one unchanged.
    SPDF_DLL
    std::string path_join(std::string const& a, std::string const& b);

    // Shell-style wildcard match of name against pattern, with the
    // semantics of find -name.
    SPDF_DLL
    bool glob_match(std::string const& pattern, std::string const& name);

    // Return a string containing the byte representation of the
    // hexadecimal encoding of the input string.
    SPDF_DLL
    std::string hex_encode(std::string const&);

    // Return 2 * nbytes lowercase hex digits drawn from the crypto
    // provider's random number generator.
    SPDF_DLL
    std::string random_hex(size_t nbytes);

    SPDF_DLL
    std::string str_tolower(std::string const&);

    // Remove leading and trailing white space.
    SPDF_DLL
    std::string trim(std::string const&);

    // Split at runs of white space.
    SPDF_DLL
    std::vector<std::string> split_words(std::string const&);

    // Set stdio to use line buffered I/O
    SPDF_DLL
    void setLineBuf(FILE*);

    // May modify argv0
    SPDF_DLL
    char* getWhoami(char* argv0);

    // Get the value of an environment variable in a portable fashion.
    // Returns true iff the variable is defined. If `value' is
    // non-null, initializes it with the value of the variable.
    SPDF_DLL
    bool get_env(std::string const& var, std::string* value = nullptr);

    // TMPDIR if set, else /tmp.
    SPDF_DLL
    std::string temp_directory();

    // The current local time as "YYYY-MM-DD HH:MM:SS".
    SPDF_DLL
    std::string current_timestamp();

    // Seconds since the epoch as a double, for timing stages.
    SPDF_DLL
    double now_seconds();

    SPDF_DLL
    std::list<std::string> read_lines_from_file(char const* filename, bool preserve_eol = false);

    // Write the string to a new file, replacing any existing file.
    SPDF_DLL
    void write_file(char const* filename, std::string const& contents);
}; // namespace SUtil

#endif // SUTIL_HH
