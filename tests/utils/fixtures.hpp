#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

namespace tnsprobe::test {

// "00 0a 00 00" 形式の16進ダンプをバイト列に変換（空白は無視）
std::vector<std::uint8_t> from_hex(std::string_view hex);

// 単純なヘッダー
inline constexpr const char* kHeaderSmallHex = "00 08 00 01 02 03 00 45";
inline constexpr const char* kHeaderLargeHex = "f2 1e 01 00 07 06 76 54";

// Data パケット
inline constexpr const char* kDataEmptyHex = "00 0a 00 00 06 00 00 00 80 00";
inline constexpr const char* kDataTrivialHex = "00 10 00 00 06 00 00 00 00 01 31 32 33 34 35 36";

// クライアントの NSN 要求 (Data, 0xa8 バイト)
inline constexpr const char* kNSNRequestHex =
  "00 a8 00 00 06 00 00 00 00 00 de ad be ef 00 9e "
  "0a 20 03 00 00 04 00 00 04 00 03 00 00 00 00 00 "
  "04 00 05 0a 20 03 00 00 08 00 01 00 00 04 ec 19 "
  "2c 7b 4c 00 12 00 01 de ad be ef 00 03 00 00 00 "
  "04 00 04 00 01 00 01 00 02 00 01 00 05 00 00 00 "
  "00 00 04 00 05 0a 20 03 00 00 02 00 03 e0 e1 00 "
  "02 00 06 fc ff 00 01 00 02 01 00 03 00 00 4e 54 "
  "53 00 02 00 02 00 00 00 00 00 04 00 05 0a 20 03 "
  "00 00 0c 00 01 00 11 06 10 0c 0f 0a 0b 08 02 01 "
  "03 00 03 00 02 00 00 00 00 00 04 00 05 0a 20 03 "
  "00 00 03 00 01 00 03 01";

// Connect v0x13a, SERVICE_NAME=ckdb (0xca バイト)
inline constexpr const char* kConnect013AHex =
  "00 ca 00 00 01 00 00 00 01 3a 01 2c 0c 41 20 00 "
  "ff ff 7f 08 00 00 01 00 00 90 00 3a 00 00 08 00 "
  "41 41 00 00 00 00 00 00 00 00 00 00 00 00 00 00 "
  "00 00 00 00 00 00 00 00 00 00 28 44 45 53 43 52 "
  "49 50 54 49 4f 4e 3d 28 43 4f 4e 4e 45 43 54 5f "
  "44 41 54 41 3d 28 53 45 52 56 49 43 45 5f 4e 41 "
  "4d 45 3d 63 6b 64 62 29 28 43 49 44 3d 28 50 52 "
  "4f 47 52 41 4d 3d 67 73 71 6c 29 28 48 4f 53 54 "
  "3d 4d 63 41 66 65 65 29 28 55 53 45 52 3d 72 6f "
  "6f 74 29 29 29 28 41 44 44 52 45 53 53 3d 28 50 "
  "52 4f 54 4f 43 4f 4c 3d 54 43 50 29 28 48 4f 53 "
  "54 3d 31 30 2e 31 2e 35 30 2e 31 34 29 28 50 4f "
  "52 54 3d 31 35 32 31 29 29 29";

// Connect v0x138, header flags 0x04, connection_id0 あり (0x100 バイト)
inline constexpr const char* kConnect138aHex =
  "01 00 00 00 01 04 00 00 01 38 01 2c 00 00 08 00 "
  "7f ff 86 0e 00 00 01 00 00 c6 00 3a 00 00 02 00 "
  "61 61 00 00 00 00 00 00 00 00 00 00 04 10 00 00 "
  "00 03 00 00 00 00 00 00 00 00 28 44 45 53 43 52 "
  "49 50 54 49 4f 4e 3d 28 41 44 44 52 45 53 53 3d "
  "28 50 52 4f 54 4f 43 4f 4c 3d 54 43 50 29 28 48 "
  "4f 53 54 3d 31 39 32 2e 31 36 38 2e 31 2e 32 32 "
  "31 29 28 50 4f 52 54 3d 31 35 32 31 29 29 28 43 "
  "4f 4e 4e 45 43 54 5f 44 41 54 41 3d 28 53 49 44 "
  "3d 76 6f 69 64 29 28 53 45 52 56 45 52 3d 44 45 "
  "44 49 43 41 54 45 44 29 28 43 49 44 3d 28 50 52 "
  "4f 47 52 41 4d 3d 46 3a 5c 6f 72 61 63 6c 65 5c "
  "6f 72 61 39 32 5c 62 69 6e 5c 73 71 6c 70 6c 75 "
  "73 2e 65 78 65 29 28 48 4f 53 54 3d 46 41 4e 47 "
  "48 4f 4e 47 5a 48 41 4f 29 28 55 53 45 52 3d 41 "
  "64 6d 69 6e 69 73 74 72 61 74 6f 72 29 29 29 29";

// Connect v0x138 (0xec バイト)
inline constexpr const char* kConnect138bHex =
  "00 ec 00 00 01 04 00 00 01 38 01 2c 00 00 08 00 "
  "7f ff 86 0e 00 00 01 00 00 b2 00 3a 00 00 02 00 "
  "61 61 00 00 00 00 00 00 00 00 00 00 10 ec 00 00 "
  "00 05 00 00 00 00 00 00 00 00 28 44 45 53 43 52 "
  "49 50 54 49 4f 4e 3d 28 41 44 44 52 45 53 53 3d "
  "28 50 52 4f 54 4f 43 4f 4c 3d 54 43 50 29 28 48 "
  "4f 53 54 3d 41 41 29 28 50 4f 52 54 3d 31 35 32 "
  "31 29 29 28 43 4f 4e 4e 45 43 54 5f 44 41 54 41 "
  "3d 28 53 49 44 3d 76 6f 69 64 29 28 53 45 52 56 "
  "45 52 3d 44 45 44 49 43 41 54 45 44 29 28 43 49 "
  "44 3d 28 50 52 4f 47 52 41 4d 3d 44 3a 5c 6f 72 "
  "61 63 6c 65 5c 6f 72 61 39 32 5c 62 69 6e 5c 73 "
  "71 6c 70 6c 75 73 2e 65 78 65 29 28 48 4f 53 54 "
  "3d 48 49 4e 47 45 2d 48 41 4e 59 46 29 28 55 53 "
  "45 52 3d 68 61 6e 79 66 29 29 29 29";

// Connect v0x13b, data_offset 0x46 で 12 バイトの padding あり (0xd7 バイト)
inline constexpr const char* kConnectPaddedHex =
  "00 d7 00 00 01 00 00 00 01 3b 01 2c 0c 41 20 00 "
  "ff ff 7f 08 00 00 01 00 00 91 00 46 00 00 08 00 "
  "41 41 00 00 00 00 00 00 00 00 00 00 00 00 00 00 "
  "00 00 00 00 00 00 00 00 00 00 00 00 20 00 00 20 "
  "00 00 00 00 00 00 28 44 45 53 43 52 49 50 54 49 "
  "4f 4e 3d 28 43 4f 4e 4e 45 43 54 5f 44 41 54 41 "
  "3d 28 53 49 44 3d 6f 72 63 6c 31 31 67 29 28 43 "
  "49 44 3d 28 50 52 4f 47 52 41 4d 3d 73 71 6c 70 "
  "6c 75 73 40 6b 61 6c 69 29 28 48 4f 53 54 3d 6b "
  "61 6c 69 29 28 55 53 45 52 3d 72 6f 6f 74 29 29 "
  "29 28 41 44 44 52 45 53 53 3d 28 50 52 4f 54 4f "
  "43 4f 4c 3d 54 43 50 29 28 48 4f 53 54 3d 31 30 "
  "2e 30 2e 37 32 2e 31 31 33 29 28 50 4f 52 54 3d "
  "31 35 32 31 29 29 29";

// Accept v0x139 (0x20 バイト)
inline constexpr const char* kAccept0139Hex =
  "00 20 00 00 02 00 00 00 01 39 00 00 08 00 7f ff "
  "01 00 00 00 00 20 61 61 00 00 00 00 00 00 00 00";

inline constexpr const char* kConnect013AString =
  "(DESCRIPTION=(CONNECT_DATA=(SERVICE_NAME=ckdb)(CID=(PROGRAM=gsql)(HOST=McAfee)(USER=root)))"
  "(ADDRESS=(PROTOCOL=TCP)(HOST=10.1.50.14)(PORT=1521)))";

inline constexpr const char* kConnect138aString =
  "(DESCRIPTION=(ADDRESS=(PROTOCOL=TCP)(HOST=192.168.1.221)(PORT=1521))"
  "(CONNECT_DATA=(SID=void)(SERVER=DEDICATED)"
  "(CID=(PROGRAM=F:\\oracle\\ora92\\bin\\sqlplus.exe)(HOST=FANGHONGZHAO)(USER=Administrator))))";

inline constexpr const char* kConnect138bString =
  "(DESCRIPTION=(ADDRESS=(PROTOCOL=TCP)(HOST=AA)(PORT=1521))"
  "(CONNECT_DATA=(SID=void)(SERVER=DEDICATED)"
  "(CID=(PROGRAM=D:\\oracle\\ora92\\bin\\sqlplus.exe)(HOST=HINGE-HANYF)(USER=hanyf))))";

inline constexpr const char* kConnectPaddedString =
  "(DESCRIPTION=(CONNECT_DATA=(SID=orcl11g)(CID=(PROGRAM=sqlplus@kali)(HOST=kali)(USER=root)))"
  "(ADDRESS=(PROTOCOL=TCP)(HOST=10.0.72.113)(PORT=1521)))";

} // namespace tnsprobe::test
