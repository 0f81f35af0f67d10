#pragma once

// Public interfaces for embedding the workspace: the collaborator contracts
// a host implements and the logger.

#include <termdeck/catalog.hpp>
#include <termdeck/logger.hpp>
#include <termdeck/preferences.hpp>
#include <termdeck/process_backend.hpp>
#include <termdeck/types.hpp>
