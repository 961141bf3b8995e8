// Copyright (C) 2020-2024 Sami Väisänen
// Copyright (C) 2020-2024 Ensisoft http://www.ensisoft.com
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <https://www.gnu.org/licenses/>.

// project level configuration. every source file includes this first.

#pragma once

#include "base/platform.h"

// the build system can turn these off with -DSWARM_NO_LOGGING etc.
#if !defined(SWARM_NO_LOGGING) && !defined(BASE_LOGGING_ENABLE_LOG)
#  define BASE_LOGGING_ENABLE_LOG
#endif

#if !defined(BASE_FORMAT_SUPPORT_GLM)
#  define BASE_FORMAT_SUPPORT_GLM
#endif

#if !defined(BASE_FORMAT_SUPPORT_MAGIC_ENUM)
#  define BASE_FORMAT_SUPPORT_MAGIC_ENUM
#endif

// glm needs this for the gtx extensions (norm, string_cast)
#if !defined(GLM_ENABLE_EXPERIMENTAL)
#  define GLM_ENABLE_EXPERIMENTAL
#endif

// maximum number of simultaneous color attachments a render target
// can have. OpenGL ES 3.0 guarantees at least 4.
#define SWARM_MAX_COLOR_ATTACHMENTS 4
