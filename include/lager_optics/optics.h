// optics.h - Convenience header pulling in the whole accessor algebra

#pragma once

#include <lager_optics/lager_optics_config.h>
#include <lager_optics/lens.h>
#include <lager_optics/traversal.h>
#include <lager_optics/compose.h>
#include <lager_optics/program.h>
#include <lager_optics/indexed_nexus.h>
#include <lager_optics/capability.h>
#include <lager_optics/logic.h>
#include <lager_optics/laws.h>
