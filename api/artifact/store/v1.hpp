#pragma once

// Public data model: Document, Artifact, MetadataSnapshot.
#include "artifact/store/v1/artifact.pb.h"
