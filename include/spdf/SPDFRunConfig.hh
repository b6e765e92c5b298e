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

#ifndef SPDFRUNCONFIG_HH
#define SPDFRUNCONFIG_HH

#include <spdf/Constants.h>
#include <spdf/DLL.h>

#include <memory>
#include <string>
#include <vector>

// The resolved configuration of one spdf invocation. An SPDFRunConfig
// is immutable: it is assembled with SPDFRunConfig::Builder, and copies
// share a single read-only representation, so every work item sees
// exactly the same values. SPDFConfigFile::resolve is the usual way to
// obtain one.
class SPDFRunConfig
{
  private:
    class Members;

  public:
    class Builder
    {
      public:
        // Start from the documented defaults.
        SPDF_DLL
        Builder();
        // Start from an existing configuration.
        SPDF_DLL
        Builder(SPDFRunConfig const&);

        SPDF_DLL
        Builder& inputDir(std::string const&);
        SPDF_DLL
        Builder& outputDir(std::string const&);
        // Empty means no attachment directory.
        SPDF_DLL
        Builder& attachmentDir(std::string const&);
        SPDF_DLL
        Builder& relock(bool);
        SPDF_DLL
        Builder& logFile(std::string const&);
        SPDF_DLL
        Builder& filePattern(std::string const&);
        // Throws std::logic_error unless seconds > 0.
        SPDF_DLL
        Builder& passwordTimeout(int seconds);
        SPDF_DLL
        Builder& dryRun(bool);
        SPDF_DLL
        Builder& outputPrefix(std::string const&);
        SPDF_DLL
        Builder& mirrorDirStructure(bool);
        SPDF_DLL
        Builder& encryptionStrength(spdf_encryption_strength_e);
        SPDF_DLL
        Builder& exiftoolArgs(std::vector<std::string> const&);
        SPDF_DLL
        Builder& deleteAttachments(bool);
        SPDF_DLL
        Builder& quality(spdf_quality_e);
        SPDF_DLL
        Builder& cliOverride(bool);
        SPDF_DLL
        Builder& linearize(bool);
        SPDF_DLL
        Builder& saveStepFiles(bool);
        // Empty selects the system temporary directory.
        SPDF_DLL
        Builder& workDir(std::string const&);
        SPDF_DLL
        Builder& qpdfProgram(std::string const&);
        SPDF_DLL
        Builder& pdfdetachProgram(std::string const&);
        SPDF_DLL
        Builder& exiftoolProgram(std::string const&);
        SPDF_DLL
        Builder& ghostscriptProgram(std::string const&);
        // Process exactly input into output instead of scanning the
        // input directory.
        SPDF_DLL
        Builder& explicitPair(std::string const& input, std::string const& output);
        SPDF_DLL
        Builder& clearExplicitPair();

        SPDF_DLL
        SPDFRunConfig build() const;

      private:
        std::shared_ptr<Members> m;
    };

    // A configuration holding the documented defaults.
    SPDF_DLL
    SPDFRunConfig();

    SPDF_DLL
    std::string const& getInputDir() const;
    SPDF_DLL
    std::string const& getOutputDir() const;
    SPDF_DLL
    std::string const& getAttachmentDir() const;
    SPDF_DLL
    bool getRelock() const;
    SPDF_DLL
    std::string const& getLogFile() const;
    SPDF_DLL
    std::string const& getFilePattern() const;
    SPDF_DLL
    int getPasswordTimeout() const;
    SPDF_DLL
    bool getDryRun() const;
    SPDF_DLL
    std::string const& getOutputPrefix() const;
    SPDF_DLL
    bool getMirrorDirStructure() const;
    SPDF_DLL
    spdf_encryption_strength_e getEncryptionStrength() const;
    SPDF_DLL
    std::vector<std::string> const& getExiftoolArgs() const;
    SPDF_DLL
    bool getDeleteAttachments() const;
    SPDF_DLL
    spdf_quality_e getQuality() const;
    SPDF_DLL
    bool getCliOverride() const;
    SPDF_DLL
    bool getLinearize() const;
    SPDF_DLL
    bool getSaveStepFiles() const;
    SPDF_DLL
    std::string const& getWorkDir() const;
    SPDF_DLL
    std::string const& getQpdfProgram() const;
    SPDF_DLL
    std::string const& getPdfdetachProgram() const;
    SPDF_DLL
    std::string const& getExiftoolProgram() const;
    SPDF_DLL
    std::string const& getGhostscriptProgram() const;
    SPDF_DLL
    bool hasExplicitPair() const;
    SPDF_DLL
    std::string const& getExplicitInput() const;
    SPDF_DLL
    std::string const& getExplicitOutput() const;

    // "screen", "ebook", "printer" or "prepress"
    SPDF_DLL
    static char const* qualityName(spdf_quality_e);

  private:
    SPDFRunConfig(std::shared_ptr<Members const>);

    std::shared_ptr<Members const> m;
};

#endif // SPDFRUNCONFIG_HH
