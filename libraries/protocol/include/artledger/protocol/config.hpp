/*
 * Copyright (c) 2023 Michel Santos and contributors.
 *
 * The MIT License
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
 * THE SOFTWARE.
 */
#pragma once

#define ARTLEDGER_DEFAULT_COLLECTION_NAME    "AI Artwork"
#define ARTLEDGER_DEFAULT_COLLECTION_SYMBOL  "AIART"
#define ARTLEDGER_DEFAULT_LEDGER_SEED_NAME   "artledger"

/// Identifier assigned to the first minted token
#define ARTLEDGER_FIRST_TOKEN_ID             1

/// Value a code-bearing recipient must return to acknowledge a safe transfer
#define ARTLEDGER_RECEIVER_MAGIC             uint32_t(0x150b7a02)

/// Interface identifiers answered by supports_interface()
#define ARTLEDGER_INTERFACE_ID_INTROSPECTION uint32_t(0x01ffc9a7)
#define ARTLEDGER_INTERFACE_ID_LEDGER        uint32_t(0x80ac58cd)
#define ARTLEDGER_INTERFACE_ID_METADATA      uint32_t(0x5b5e139f)
#define ARTLEDGER_INTERFACE_ID_INVALID       uint32_t(0xffffffff)

#define ARTLEDGER_CANVAS_SIZE                400
#define ARTLEDGER_ARTWORK_NAME_PREFIX        "AI Artwork #"
#define ARTLEDGER_ARTWORK_DESCRIPTION \
   "Generative artwork whose palette and shape are derived on demand from a pseudo-random seed."

#define ARTLEDGER_JSON_URI_PREFIX            "data:application/json;utf8,"
#define ARTLEDGER_SVG_URI_PREFIX             "data:image/svg+xml;utf8,"

#define ARTLEDGER_MAX_VARIANT_DEPTH          10

#define ARTLEDGER_DEFAULT_GENESIS_TIMESTAMP  1700000000
#define ARTLEDGER_DEFAULT_BLOCK_INTERVAL     3
#define ARTLEDGER_DEFAULT_HISTORY_MAX_PER_ACCOUNT 100
