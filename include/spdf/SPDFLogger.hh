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

#ifndef SPDFLOGGER_HH
#define SPDFLOGGER_HH

#include <spdf/DLL.h>
#include <spdf/Pipeline.hh>

#include <iostream>
#include <memory>
#include <string>

class SPDFLogger
{
  public:
    SPDF_DLL
    static std::shared_ptr<SPDFLogger> create();

    // Return the default logger. The spdf executable uses it. Create
    // your own loggers to capture or redirect output, for example when
    // running several jobs in one process or in tests.
    SPDF_DLL
    static std::shared_ptr<SPDFLogger> defaultLogger();

    // Defaults:
    //
    // info -- standard output
    // warn -- whatever error points to
    // error -- standard error
    //
    // info, warn and error each write one line. The line is prefixed
    // with the local time as "[YYYY-MM-DD HH:MM:SS] "; warnings get an
    // additional "WARNING: " tag and errors an "ERROR: " tag. A newline
    // is appended. When a log file has been set, the same line is also
    // appended to it.
    //
    // On deletion, finish() is called for the standard output and
    // standard error pipelines, which flushes output, and the log file
    // is closed. If you supply any custom pipelines, you must call
    // finish() on them yourself.
    //
    // Calls are serialized, so a logger may be shared by threads.
    SPDF_DLL
    void info(std::string const&);
    SPDF_DLL
    std::shared_ptr<Pipeline> getInfo(bool null_okay = false);

    SPDF_DLL
    void warn(std::string const&);
    SPDF_DLL
    std::shared_ptr<Pipeline> getWarn(bool null_okay = false);

    SPDF_DLL
    void error(std::string const&);
    SPDF_DLL
    std::shared_ptr<Pipeline> getError(bool null_okay = false);

    SPDF_DLL
    std::shared_ptr<Pipeline> standardOutput();
    SPDF_DLL
    std::shared_ptr<Pipeline> standardError();
    SPDF_DLL
    std::shared_ptr<Pipeline> discard();

    // Passing a null pointer resets to default
    SPDF_DLL
    void setInfo(std::shared_ptr<Pipeline>);
    SPDF_DLL
    void setWarn(std::shared_ptr<Pipeline>);
    SPDF_DLL
    void setError(std::shared_ptr<Pipeline>);

    // Shortcut for logic to reset output to new output/error streams.
    // out_stream is used for info, err_stream is used for error, and
    // warning is cleared so that it follows error.
    SPDF_DLL
    void setOutputStreams(std::ostream* out_stream, std::ostream* err_stream);

    // Open path in append mode and copy every subsequent line to it.
    // Missing parent directories are created. Throws SPDFSystemError
    // if the file can't be opened. An empty path closes the current
    // log file. Any held lines (see holdForLogFile) are written to the
    // new log file first; they are dropped if the path is empty or the
    // file can't be opened.
    SPDF_DLL
    void setLogFile(std::string const& path);

    // While no log file is open, keep a copy of every line so that
    // the next call to setLogFile can write it. This is for messages
    // that are written before the name of the log file is known.
    // hold == false stops holding and drops the held lines.
    SPDF_DLL
    void holdForLogFile(bool hold = true);
    SPDF_DLL
    std::string getLogFile() const;

  private:
    SPDFLogger();
    std::shared_ptr<Pipeline> throwIfNull(std::shared_ptr<Pipeline>, bool null_okay);
    void writeLine(std::shared_ptr<Pipeline> p, char const* tag, std::string const& msg);

    class Members;
    std::shared_ptr<Members> m;
};

#endif // SPDFLOGGER_HH
