//--------------------------------------------------------------------------------------------------
// Copyright (c) 2021 Marcus Geelnard
//
// This software is provided 'as-is', without any express or implied warranty. In no event will the
// authors be held liable for any damages arising from the use of this software.
//
// Permission is granted to anyone to use this software for any purpose, including commercial
// applications, and to alter it and redistribute it freely, subject to the following restrictions:
//
//  1. The origin of this software must not be misrepresented; you must not claim that you wrote
//     the original software. If you use this software in a product, an acknowledgment in the
//     product documentation would be appreciated but is not required.
//
//  2. Altered source versions must be plainly marked as such, and must not be misrepresented as
//     being the original software.
//
//  3. This notice may not be removed or altered from any source distribution.
//--------------------------------------------------------------------------------------------------

//--------------------------------------------------------------------------------------------------
// Purpose:  This is the Doxygen main page. The file is not actually used by the dirlease source.
//--------------------------------------------------------------------------------------------------

#ifndef DIRLEASE_DOC_MAINPAGE_HPP_
#define DIRLEASE_DOC_MAINPAGE_HPP_

/// @mainpage dirlease internals documentation
///
/// @section intro_sec Introduction
///
/// dirlease is an advisory, cross-process lock for file system paths. A lock is represented on
/// disk by a directory next to the locked path (<path>.lock), which is created atomically. The
/// holder keeps the lock fresh by periodically updating the modification time of the directory,
/// and a lock that has not been updated within the stale threshold may be reclaimed by others.
///
/// @section usage_sec Usage
///
/// @code
/// dlease::lock_manager_t manager;
/// auto lease = manager.lock("/path/to/file", dlease::lock_options_t());
/// // ...exclusive access to /path/to/file...
/// lease.release();
/// @endcode
///
/// @section structur_sec Code structure
///
/// The dirlease source code is divided into the following parts:
///   - base - A portable set of support classes and functions.
///   - lease - The lock protocol (acquisition, renewal, release).
///   - config - Program configuration logic.
///
/// @section namespaces_sec Namespaces
///
/// The following namespaces are used in dirlease:
///   - @ref dlease
///   - @ref dlease::config
///   - @ref dlease::debug
///   - @ref dlease::file
///   - @ref dlease::time

/// @namespace dlease
/// @brief The top level namespace.
///
/// All dirlease functionality lives in the @c dlease namespace or one of its decendant
/// namespaces.

/// @namespace dlease::config
/// @brief dirlease configuration options.
///
/// Configuration options are gathered the first time that they are needed, and they can be queried
/// via the functions in the @c config namespace (which acts as a sigleton).

/// @namespace dlease::debug
/// @brief Debug logging functions.

/// @namespace dlease::file
/// @brief File system helper functions.

/// @namespace dlease::time
/// @brief Time related helper functions.

#endif  // DIRLEASE_DOC_MAINPAGE_HPP_
