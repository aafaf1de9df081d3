#pragma once

using byte = unsigned char;
