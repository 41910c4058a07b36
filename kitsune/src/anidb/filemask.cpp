#include "filemask.h"
#include <utility>

namespace FileMask
{

namespace
{

// Bits in payload order (most significant first)
const std::pair<uint32_t, const char*> kFMaskFields[] = {
	{fAID, "aid"},
	{fEID, "eid"},
	{fGID, "gid"},
	{fLID, "lid"},
	{fOTHEREPS, "othereps"},
	{fISDEPR, "isdepr"},
	{fSTATE, "state"},
	{fSIZE, "size"},
	{fED2K, "ed2k"},
	{fMD5, "md5"},
	{fSHA1, "sha1"},
	{fCRC32, "crc32"},
	{fCOLOUR_DEPTH, "colour_depth"},
	{fQUALITY, "quality"},
	{fSOURCE, "source"},
	{fCODEC_AUDIO, "codec_audio"},
	{fBITRATE_AUDIO, "bitrate_audio"},
	{fCODEC_VIDEO, "codec_video"},
	{fBITRATE_VIDEO, "bitrate_video"},
	{fRESOLUTION, "resolution"},
	{fFILETYPE, "filetype"},
	{fLANG_DUB, "lang_dub"},
	{fLANG_SUB, "lang_sub"},
	{fLENGTH, "length"},
	{fDESCRIPTION, "description"},
	{fAIRDATE, "airdate"},
	{fFILENAME, "filename"},
};

const std::pair<uint32_t, const char*> kAMaskFields[] = {
	{aEPISODE_TOTAL, "episode_total"},
	{aEPISODE_LAST, "episode_last"},
	{aANIME_YEAR, "year"},
	{aANIME_TYPE, "type"},
	{aANIME_RELATED_LIST, "related_aid_list"},
	{aANIME_RELATED_TYPE, "related_aid_type"},
	{aANIME_CATAGORY, "category"},
	{aANIME_NAME_ROMAJI, "anime_name_romaji"},
	{aANIME_NAME_KANJI, "anime_name_kanji"},
	{aANIME_NAME_ENGLISH, "anime_name_english"},
	{aANIME_NAME_OTHER, "anime_name_other"},
	{aANIME_NAME_SHORT, "anime_name_short"},
	{aANIME_SYNONYMS, "anime_synonyms"},
	{aEPISODE_NUMBER, "epno"},
	{aEPISODE_NAME, "ep_name"},
	{aEPISODE_NAME_ROMAJI, "ep_name_romaji"},
	{aEPISODE_NAME_KANJI, "ep_name_kanji"},
	{aEPISODE_RATING, "ep_rating"},
	{aEPISODE_VOTE_COUNT, "ep_vote_count"},
	{aGROUP_NAME, "group_name"},
	{aGROUP_NAME_SHORT, "group_name_short"},
	{aDATE_AID_RECORD_UPDATED, "date_aid_record_updated"},
};

} // namespace

QStringList fieldNames(uint32_t fmask, uint32_t amask)
{
	QStringList names;
	names << QStringLiteral("fid");
	for (const auto& field : kFMaskFields)
	{
		if (fmask & field.first)
		{
			names << QString::fromLatin1(field.second);
		}
	}
	for (const auto& field : kAMaskFields)
	{
		if (amask & field.first)
		{
			names << QString::fromLatin1(field.second);
		}
	}
	return names;
}

QString toHex(uint32_t mask)
{
	return QString("%1").arg(mask, 8, 16, QChar('0'));
}

bool fromHex(const QString& hex, uint32_t& mask)
{
	if (hex.isEmpty() || hex.length() > 8)
	{
		return false;
	}
	bool ok = false;
	const uint value = hex.toUInt(&ok, 16);
	if (!ok)
	{
		return false;
	}
	mask = value;
	return true;
}

} // namespace FileMask
