#ifndef FILEMASK_H
#define FILEMASK_H

#include <QString>
#include <QStringList>
#include <cstdint>

/**
 * @file filemask.h
 * @brief Field-selection bitmasks of the AniDB FILE command
 *
 * FILE takes two 32-bit masks sent as 8 hex characters:
 * - fmask selects file fields
 * - amask selects anime, episode and group fields returned with the file
 *
 * The 220 reply lists `fid` first, then every selected fmask field from the
 * most significant bit down, then every selected amask field the same way.
 * fieldNames() reproduces that order so a payload can be decoded by position.
 */
namespace FileMask
{

// FILE command fmask (file data fields)
enum FMaskBits : uint32_t
{
	fAID =				0x40000000,
	fEID =				0x20000000,
	fGID =				0x10000000,
	fLID =				0x08000000,
	fOTHEREPS =			0x04000000,
	fISDEPR =			0x02000000,
	fSTATE =			0x01000000,
	fSIZE =				0x00800000,
	fED2K =				0x00400000,
	fMD5 =				0x00200000,
	fSHA1 =				0x00100000,
	fCRC32 =			0x00080000,
	fCOLOUR_DEPTH =		0x00020000,
	fQUALITY =			0x00008000,
	fSOURCE =			0x00004000,
	fCODEC_AUDIO =		0x00002000,
	fBITRATE_AUDIO =	0x00001000,
	fCODEC_VIDEO =		0x00000800,
	fBITRATE_VIDEO =	0x00000400,
	fRESOLUTION =		0x00000200,
	fFILETYPE =			0x00000100,
	fLANG_DUB =			0x00000080,
	fLANG_SUB =			0x00000040,
	fLENGTH =			0x00000020,
	fDESCRIPTION =		0x00000010,
	fAIRDATE =			0x00000008,
	fFILENAME =			0x00000001
};

// FILE command amask (anime/episode/group data fields returned with file)
enum AMaskBits : uint32_t
{
	aEPISODE_TOTAL =			0x80000000,
	aEPISODE_LAST =				0x40000000,
	aANIME_YEAR =				0x20000000,
	aANIME_TYPE =				0x10000000,
	aANIME_RELATED_LIST =		0x08000000,
	aANIME_RELATED_TYPE =		0x04000000,
	aANIME_CATAGORY =			0x02000000,
	aANIME_NAME_ROMAJI =		0x00800000,
	aANIME_NAME_KANJI =			0x00400000,
	aANIME_NAME_ENGLISH =		0x00200000,
	aANIME_NAME_OTHER =			0x00100000,
	aANIME_NAME_SHORT =			0x00080000,
	aANIME_SYNONYMS =			0x00040000,
	aEPISODE_NUMBER =			0x00008000,
	aEPISODE_NAME =				0x00004000,
	aEPISODE_NAME_ROMAJI =		0x00002000,
	aEPISODE_NAME_KANJI =		0x00001000,
	aEPISODE_RATING =			0x00000800,
	aEPISODE_VOTE_COUNT =		0x00000400,
	aGROUP_NAME =				0x00000080,
	aGROUP_NAME_SHORT =			0x00000040,
	aDATE_AID_RECORD_UPDATED =	0x00000001
};

// Masks requested when the settings do not override them
constexpr uint32_t DEFAULT_FMASK =
	fAID | fEID | fGID | fLID | fOTHEREPS | fISDEPR | fSTATE |
	fSIZE | fED2K | fMD5 | fSHA1 | fCRC32 |
	fQUALITY | fSOURCE | fCODEC_AUDIO | fCODEC_VIDEO | fRESOLUTION | fFILETYPE |
	fLANG_DUB | fLANG_SUB | fLENGTH | fAIRDATE | fFILENAME;

constexpr uint32_t DEFAULT_AMASK =
	aEPISODE_TOTAL | aEPISODE_LAST | aANIME_YEAR | aANIME_TYPE |
	aANIME_NAME_ROMAJI | aANIME_NAME_KANJI | aANIME_NAME_ENGLISH |
	aEPISODE_NUMBER | aEPISODE_NAME | aEPISODE_NAME_ROMAJI | aEPISODE_NAME_KANJI |
	aGROUP_NAME | aGROUP_NAME_SHORT | aDATE_AID_RECORD_UPDATED;

/**
 * @brief Names of the reply fields in payload order, starting with "fid"
 */
QStringList fieldNames(uint32_t fmask, uint32_t amask);

// 8 lowercase hex characters, as sent on the wire
QString toHex(uint32_t mask);

// Parses 1-8 hex characters; returns false on anything else
bool fromHex(const QString& hex, uint32_t& mask);

} // namespace FileMask

#endif // FILEMASK_H
