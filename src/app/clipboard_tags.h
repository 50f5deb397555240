#pragma once

// Shared tag IDs for routing clipboard results back to the request that issued them.
// Keep these stable: they may be used across multiple call sites.
enum ClipboardTag
{
    kClipboard_CopyResults = 1,
    kClipboard_PastePath   = 2,
};
