// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "archdiagram/ArchDiagramGlobal.hpp"

Q_LOGGING_CATEGORY(archdiagramlog, "archdiagram")
