#pragma once

#ifndef CURVEFAND_VERSION
#define CURVEFAND_VERSION "0.3.0"
#endif
