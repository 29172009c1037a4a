/** \file   RemoteFetcher.h
 *  \brief  Decides whether a dump has to be downloaded and obtains a verified local copy of it.
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
#pragma once


#include <string>
#include "DatasetStore.h"
#include "DumpSource.h"
#include "ManifestStore.h"
#include "RetryPolicy.h"
#include "SyncTypes.h"


namespace OLSync {


/** \class  RemoteFetcher
 *  \brief  Downloads dumps into a download directory.
 *  \note   For a dump named N the directory may contain
 *          N.part            an incomplete download,
 *          N.part.signature  the change signature the incomplete download belongs to,
 *          N                 the complete, verified download and
 *          N.fetch.json      the FetchResult for N.
 */
class RemoteFetcher {
    DumpSource * const dump_source_;
    const ManifestStore &manifest_store_;
    const RetryPolicy &retry_policy_;
    std::string download_directory_;
    DatasetStore * const backup_store_; // May be nullptr.

public:
    RemoteFetcher(DumpSource * const dump_source, const ManifestStore &manifest_store, const RetryPolicy &retry_policy,
                  const std::string &download_directory, DatasetStore * const backup_store = nullptr);

    //* \brief Asks the origin for the current version of "url".  Retried according to our RetryPolicy.
    SourceDescriptor probe(const std::string &name, const Category category, const std::string &url) const;

    //* \return True if the manifest has no entry for the source, a different signature, or no content hash.
    bool needsFetch(const SourceDescriptor &descriptor) const;

    /** \brief  Returns a verified local copy of the version of the dump identified by "descriptor".
     *  \note   A complete earlier download of the same version is reused.  An incomplete one is resumed.  If the
     *          origin keeps failing we try to recover the dump from the raw backup in the dataset store.
     *  \throws RetryableError's after the last attempt, FatalError or CancelledError.
     */
    FetchResult fetch(const SourceDescriptor &descriptor);

    std::string getLocalPath(const std::string &name) const { return download_directory_ + "/" + name; }

    //* \return False if there is no complete download of "name" in "download_directory".
    static bool LoadFetchResult(const std::string &download_directory, const std::string &name, FetchResult * const fetch_result);

    //* \brief Removes a complete download and its FetchResult.
    static void RemoveDownload(const FetchResult &fetch_result);

    static std::string GetRawBackupMetadataPath(const std::string &name) { return "raw/" + name + ".json"; }
private:
    FetchResult downloadOnce(const SourceDescriptor &descriptor);
    FetchResult storeFetchResult(const SourceDescriptor &descriptor, const std::string &part_path, const std::string &content_sha256,
                                 const bool recovered_from_backup);
    bool recoverFromBackup(const SourceDescriptor &descriptor, FetchResult * const fetch_result);
};


} // namespace OLSync
