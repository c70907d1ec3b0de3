/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Inkwell project.
 */

#pragma once

/**
 * @file Inkwell.h
 * @brief Single header that includes all Inkwell components
 */

// Core common utilities
#include "CoreCommon.h"

// Logging
#include "Logging/ConsoleSink.h"
#include "Logging/ILogSink.h"
#include "Logging/LogEntry.h"
#include "Logging/LogLevel.h"
#include "Logging/Logger.h"

// Virtual File System
#include "VirtualFileSystem/FileOperationHandle.h"
#include "VirtualFileSystem/IFileSystemBackend.h"
#include "VirtualFileSystem/LocalFileSystemBackend.h"
#include "VirtualFileSystem/VirtualFileSystem.h"

// Incremental writes
#include "IncrementalWrite/CompletionMarker.h"
#include "IncrementalWrite/ContentClassifier.h"
#include "IncrementalWrite/IncrementalAppendEngine.h"
#include "IncrementalWrite/OverlapDetector.h"
#include "IncrementalWrite/TailReader.h"
#include "IncrementalWrite/WriteConfig.h"
#include "IncrementalWrite/WriteStrategySelector.h"
