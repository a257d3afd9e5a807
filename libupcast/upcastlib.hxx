/* Copyright (C) 2014 J.F.Dockes
 *       This program is free software; you can redistribute it and/or modify
 *       it under the terms of the GNU General Public License as published by
 *       the Free Software Foundation; either version 2 of the License, or
 *       (at your option) any later version.
 *
 *       This program is distributed in the hope that it will be useful,
 *       but WITHOUT ANY WARRANTY; without even the implied warranty of
 *       MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 *       GNU General Public License for more details.
 *
 *       You should have received a copy of the GNU General Public License
 *       along with this program; if not, write to the
 *       Free Software Foundation, Inc.,
 *       59 Temple Place - Suite 330, Boston, MA  02111-1307, USA.
 */
#ifndef _UPCASTLIB_H_X_INCLUDED_
#define _UPCASTLIB_H_X_INCLUDED_

#include <string>

#define UPCAST_VERSION "0.4.0"

namespace UpCast {

/** Return codes for the library operations. Zero is success, the
 *  others are negative, in the manner of the libupnp UPNP_E_XX values. */
enum UPCErrCode {
    UPC_OK = 0,
    /** Operation aborted through its Canceller */
    UPC_E_CANCELLED = -1,
    /** Deadline reached */
    UPC_E_TIMEOUT = -2,
    /** Device description could not be retrieved or parsed */
    UPC_E_DESCFETCH = -3,
    /** The device has no AVTransport service */
    UPC_E_NOSERVICE = -4,
    /** A remote SOAP call failed (transport or non-2xx status) */
    UPC_E_REMOTECTL = -5,
    /** File type not servable */
    UPC_E_UNSUPPORTED = -6,
    /** Transcoding tool missing or failed */
    UPC_E_TRANSCODE = -7,
    /** Bad byte range request */
    UPC_E_RANGE = -8,
    /** Object or library initialization error */
    UPC_E_INIT = -9,
    /** No such file or device */
    UPC_E_NOTFOUND = -10,
    /** Method called in the wrong state */
    UPC_E_STATE = -11,
    /** Network transfer error (connection, DNS, protocol) */
    UPC_E_NETWORK = -12,
};

/** Symbolic name for error code */
extern const char *errCodeName(int code);

/** Build a printable message: who: code name (code) */
extern std::string errAsString(const std::string& who, int code);

} // namespace UpCast

#endif /* _UPCASTLIB_H_X_INCLUDED_ */
