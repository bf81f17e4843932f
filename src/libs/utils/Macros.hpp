// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "utils/Result.hpp"

#include <QtCore/QtGlobal>

// Shared guard and early-return idioms.

#ifndef UTILS_UNUSED
#	define UTILS_UNUSED(x) Q_UNUSED(x)
#endif

#ifndef UTILS_GUARD
#	define UTILS_GUARD(cond) do { if (!(cond)) return; } while (false)
#endif

#ifndef UTILS_GUARD_RET
#	define UTILS_GUARD_RET(cond, ret) do { if (!(cond)) return (ret); } while (false)
#endif

#ifndef UTILS_GUARD_OK
#	define UTILS_GUARD_OK(cond, msg) do { if (!(cond)) return ::Utils::Result::failure((msg)); } while (false)
#endif

#ifndef UTILS_RETURN_IF
#	define UTILS_RETURN_IF(cond) do { if ((cond)) return; } while (false)
#endif

#ifndef UTILS_RETURN_VAL_IF
#	define UTILS_RETURN_VAL_IF(cond, val) do { if ((cond)) return (val); } while (false)
#endif

#ifndef UTILS_PROPAGATE
#	define UTILS_PROPAGATE(expr) do { const ::Utils::Result _r = (expr); if (!_r) return _r; } while (false)
#endif
