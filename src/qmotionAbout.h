// qmotionAbout.h
//
/****************************************************************************
   Copyright (C) 2005-2025, rncbc aka Rui Nuno Capela. All rights reserved.

   This program is free software; you can redistribute it and/or
   modify it under the terms of the GNU General Public License
   as published by the Free Software Foundation; either version 2
   of the License, or (at your option) any later version.

   This program is distributed in the hope that it will be useful,
   but WITHOUT ANY WARRANTY; without even the implied warranty of
   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
   GNU General Public License for more details.

   You should have received a copy of the GNU General Public License along
   with this program; if not, write to the Free Software Foundation, Inc.,
   51 Franklin Street, Fifth Floor, Boston, MA 02110-1301 USA.

*****************************************************************************/

#ifndef __qmotionAbout_h
#define __qmotionAbout_h

// PROJECT_* macros come from the build system.

#define QMOTION_TITLE      PROJECT_TITLE

#define QMOTION_SUBTITLE   PROJECT_DESCRIPTION
#define QMOTION_WEBSITE    PROJECT_HOMEPAGE_URL

#define QMOTION_COPYRIGHT  PROJECT_COPYRIGHT
#define QMOTION_DOMAIN     PROJECT_DOMAIN

#endif  // __qmotionAbout_h

// end of qmotionAbout.h
