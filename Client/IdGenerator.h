#pragma once

#include <string>

// Generates a random RFC 4122 version-4 UUID string (lowercase, hyphenated).
// Used for locally assigned session ids and transcript message ids.
std::string generateUuid();

// Current UTC time as ISO-8601 with milliseconds, e.g. 2024-05-01T12:00:00.123Z
std::string currentIsoTimestamp();
