/** \file    ol_dump_sync.cc
 *  \brief   Keeps a columnar copy of the Open Library dumps in a dataset repository up to date.
 *
 *  \copyright 2026 Universitätsbibliothek Tübingen.  All rights reserved.
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU Affero General Public License as
 *  published by the Free Software Foundation, either version 3 of the
 *  License, or (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *  GNU Affero General Public License for more details.
 *
 *  You should have received a copy of the GNU Affero General Public License
 *  along with this program.  If not, see <http://www.gnu.org/licenses/>.
 */
#include <iostream>
#include <memory>
#include <vector>
#include <cstdlib>
#include <cstring>
#include "DatasetStore.h"
#include "Downloader.h"
#include "DumpSource.h"
#include "FileUtil.h"
#include "IniFile.h"
#include "ManifestStore.h"
#include "StringUtil.h"
#include "SyncConfig.h"
#include "SyncPipeline.h"
#include "SyncTypes.h"
#include "util.h"


namespace {


const std::string DEFAULT_CONFIG_PATH("/usr/local/etc/ol_dump_sync.conf");


[[noreturn]] void Usage() {
    ::Usage("[--config=path] [--dry-run] [--keep] command [source]\n"
            "  command: fetch [source]    make sure the local dump(s) are current, don't publish anything\n"
            "           convert source    convert and publish a previously fetched dump\n"
            "           sync [source]     fetch followed by convert\n"
            "           status            print the manifest\n"
            "  source is \"authors\", \"editions\", \"works\" or the name of the dump file.  Without a source all enabled sources\n"
            "  are processed.  The default config file is " + DEFAULT_CONFIG_PATH + ".");
}


std::vector<OLSync::SourceConfig> GetSelectedSources(const OLSync::SyncConfig &config, const std::string &source_name) {
    std::vector<OLSync::SourceConfig> selected_sources;
    if (source_name.empty()) {
        for (const auto &source : config.sources_) {
            if (source.enabled_)
                selected_sources.emplace_back(source);
        }
        return selected_sources;
    }

    const OLSync::SourceConfig * const source(config.lookupSource(source_name));
    if (source == nullptr)
        LOG_ERROR("unknown source \"" + source_name + "\"!");
    selected_sources.emplace_back(*source);

    return selected_sources;
}


int ReportAndGetExitCode(const std::vector<OLSync::SourceReport> &reports) {
    bool any_failures(false);
    for (const auto &report : reports) {
        std::cout << report.toString() << '\n';
        if (not report.success_)
            any_failures = true;
    }

    return any_failures ? EXIT_FAILURE : EXIT_SUCCESS;
}


} // unnamed namespace


int Main(int argc, char *argv[]) {
    std::string config_path(DEFAULT_CONFIG_PATH);
    bool explicit_config(false), dry_run(false), keep(false);
    while (argc > 1 and StringUtil::StartsWith(argv[1], "--")) {
        const std::string flag(argv[1]);
        if (StringUtil::StartsWith(flag, "--config=")) {
            config_path = flag.substr(std::strlen("--config="));
            explicit_config = true;
        } else if (flag == "--dry-run")
            dry_run = true;
        else if (flag == "--keep")
            keep = true;
        else
            Usage();
        --argc, ++argv;
    }
    if (argc < 2 or argc > 3)
        Usage();

    const std::string command(argv[1]);
    const std::string source_name(argc == 3 ? argv[2] : "");

    OLSync::SyncConfig config;
    if (explicit_config or FileUtil::Exists(config_path))
        config.load(IniFile(config_path));
    else
        LOG_WARNING("\"" + config_path + "\" not found, using the built-in defaults");
    config.dry_run_ = config.dry_run_ or dry_run;
    config.keep_downloads_ = config.keep_downloads_ or keep;

    OLSync::ManifestStore manifest_store(config.manifest_path_);
    if (command == "status") {
        if (argc != 2)
            Usage();
        std::cout << manifest_store.toString();
        return EXIT_SUCCESS;
    }

    OLSync::InstallCancellationHandlers();

    OLSync::HttpDumpSource dump_source(config.getDownloaderParams(), Downloader::DEFAULT_TIME_LIMIT, config.timeout_ms_);
    const std::unique_ptr<OLSync::DatasetStore> dataset_store(OLSync::CreateDatasetStore(config));
    OLSync::SyncPipeline pipeline(config, &manifest_store, &dump_source, dataset_store.get());

    std::vector<OLSync::SourceReport> reports;
    try {
        if (command == "fetch") {
            for (const auto &source : GetSelectedSources(config, source_name)) {
                OLSync::FetchResult fetch_result;
                reports.emplace_back(pipeline.ensureLocalArtifact(source, &fetch_result));
            }
        } else if (command == "convert") {
            if (source_name.empty())
                Usage();
            for (const auto &source : GetSelectedSources(config, source_name))
                reports.emplace_back(pipeline.processLocalArtifact(source));
        } else if (command == "sync") {
            if (source_name.empty())
                reports = pipeline.runAll();
            else {
                for (const auto &source : GetSelectedSources(config, source_name))
                    reports.emplace_back(pipeline.runOne(source));
            }
        } else
            Usage();
    } catch (const OLSync::CancelledError &x) {
        ReportAndGetExitCode(reports);
        LOG_WARNING(std::string(x.what()) + ", the manifest has not been updated for the interrupted source");
        return EXIT_FAILURE;
    }

    return ReportAndGetExitCode(reports);
}
