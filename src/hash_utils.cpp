/*
 *  Copyright (C) 2004-2023 Savoir-faire Linux Inc.
 *
 *  This program is free software: you can redistribute it and/or modify
 *  it under the terms of the GNU General Public License as published by
 *  the Free Software Foundation, either version 3 of the License, or
 *  (at your option) any later version.
 *
 *  This program is distributed in the hope that it will be useful,
 *  but WITHOUT ANY WARRANTY; without even the implied warranty of
 *  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 *  GNU General Public License for more details.
 *
 *  You should have received a copy of the GNU General Public License
 *  along with this program. If not, see <https://www.gnu.org/licenses/>.
 */

#include "hash_utils.h"

#include <gnutls/gnutls.h>
#include <gnutls/crypto.h>

#include <stdexcept>
#include <string>

namespace sapcast {

Sha1Digest
sha1(std::string_view data)
{
    Sha1Digest digest;
    int err = gnutls_hash_fast(GNUTLS_DIG_SHA1, data.data(), data.size(), digest.data());
    if (err != GNUTLS_E_SUCCESS)
        throw std::runtime_error(std::string("SHA-1 failed: ") + gnutls_strerror(err));
    return digest;
}

} // namespace sapcast
