#include <gtest/gtest.h>

// This test ensures that every public header compiles cleanly when included
// together (common for downstream users).

#include "bundl/cli/commands.hpp"
#include "bundl/cli/options.hpp"
#include "bundl/codec/description_codec.hpp"
#include "bundl/core/config.hpp"
#include "bundl/core/diagnostics.hpp"
#include "bundl/core/errors.hpp"
#include "bundl/core/log.hpp"
#include "bundl/core/platform.hpp"
#include "bundl/core/types.hpp"
#include "bundl/manifest/build_manifest.hpp"
#include "bundl/manifest/description.hpp"
#include "bundl/manifest/directory_compiler.hpp"
#include "bundl/manifest/merge.hpp"
#include "bundl/net/probe.hpp"
#include "bundl/net/reconcile.hpp"
#include "bundl/storage/hashing.hpp"
#include "bundl/storage/identity.hpp"
#include "bundl/storage/staging.hpp"

TEST(PublicHeaders, Compile) {
    SUCCEED();
}
