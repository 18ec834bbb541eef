#pragma once

#include <string>

// Stable id of the item a locator points to. Every supported video URL form
// (watch?v=, youtu.be/, shorts/, m.) maps to the 11 character video id,
// any other locator is its own id.
std::string source_id_for(const std::string &locator);
