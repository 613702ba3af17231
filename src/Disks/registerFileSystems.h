#pragma once

namespace SSTIO
{

/// Registers the filesystem clients built into the library. Safe to call more than once.
void registerFileSystems();

}
