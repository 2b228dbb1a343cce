/**
 * @file secure_drive.h
 * @brief Main header for the secure_drive library
 * @version 0.1.0
 *
 * Include this header to access key management, the container codec and
 * the batch transfer pipeline.
 *
 * @code
 * #include <secure_drive/secure_drive.h>
 *
 * using namespace secure_drive;
 *
 * std::shared_ptr<key_store> store = key_store::create(
 *     file_key_storage::create(file_key_storage::default_directory()));
 * (void)store->get_or_create();
 *
 * auto orchestrator = transfer_orchestrator::builder()
 *     .with_key_store(store)
 *     .with_upload_client(client)
 *     .build();
 * @endcode
 */

#ifndef SECURE_DRIVE_SECURE_DRIVE_H
#define SECURE_DRIVE_SECURE_DRIVE_H

#include <cstdint>
#include <string>

#include "secure_drive/config/feature_flags.h"

// Core types
#include "secure_drive/core/error_codes.h"
#include "secure_drive/core/logging.h"
#include "secure_drive/core/statistics_collector.h"
#include "secure_drive/core/types.h"

// Encryption
#include "secure_drive/encryption/encryption_config.h"
#include "secure_drive/encryption/encryption_key.h"
#include "secure_drive/encryption/key_storage.h"
#include "secure_drive/encryption/key_store.h"
#include "secure_drive/encryption/random_source.h"
#include "secure_drive/encryption/stream_codec.h"

// Transfer
#include "secure_drive/transfer/progress_reporter.h"
#include "secure_drive/transfer/transfer_job.h"
#include "secure_drive/transfer/transfer_orchestrator.h"
#include "secure_drive/transfer/transfer_types.h"
#include "secure_drive/transfer/upload_client.h"

namespace secure_drive {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace secure_drive

#endif  // SECURE_DRIVE_SECURE_DRIVE_H
